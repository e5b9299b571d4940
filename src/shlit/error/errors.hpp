#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shlit {

enum class errc {
    none = 0,
    /// The argument is not text: a null pointer, or bytes that are not well-formed UTF-8
    arg_not_text,
    /// The argument contains a NUL character
    arg_contains_nul,
};

/**
 * @brief Obtain the message for the given error condition.
 *
 * These strings are stable and are used verbatim as the `what()` of the exceptions below.
 */
std::string_view default_error_string(errc ec) noexcept;

/**
 * @brief Obtain the name of the kind of error: "TypeKind" for an argument that is not text,
 * "ValueKind" for text that has an unrepresentable value.
 */
std::string_view error_kind_name(errc ec) noexcept;

/**
 * @brief Base class of the exceptions thrown by shlit::format_argument
 */
class invalid_shell_arg : public std::runtime_error {
    errc _ec;

public:
    explicit invalid_shell_arg(errc ec)
        : std::runtime_error(std::string(default_error_string(ec)))
        , _ec(ec) {}

    errc code() const noexcept { return _ec; }
};

/// The argument given is not a text value
class arg_type_error : public invalid_shell_arg {
public:
    arg_type_error()
        : invalid_shell_arg(errc::arg_not_text) {}
};

/// The argument is text, but contains a NUL
class arg_value_error : public invalid_shell_arg {
public:
    arg_value_error()
        : invalid_shell_arg(errc::arg_contains_nul) {}
};

/// Byte offset of the first ill-formed UTF-8 sequence in a rejected argument
struct e_invalid_utf8 {
    std::size_t offset;
};

/// Byte offset of the first NUL in a rejected argument
struct e_nul_offset {
    std::size_t value;
};

/**
 * @brief The argument string that was rejected. Not present when the argument was a null pointer.
 */
struct e_shell_arg {
    std::string value;

    void log_error(errc ec) const noexcept;
};

}  // namespace shlit
