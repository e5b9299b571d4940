#pragma once

#include "./format.hpp"

#include <fmt/core.h>

#include <ostream>
#include <string>
#include <string_view>

namespace shlit {

/**
 * @brief A reference to a string that formats as a POSIX shell literal.
 *
 *      shlit_log(info, "Running {} in {}", shlit::literal(prog), shlit::literal(dir));
 *
 * The wrapper holds a view of the string, not a copy, so the string must outlive it. Formatting
 * throws the same exceptions as format_argument().
 */
struct shell_literal {
    std::string_view value;

    std::string str() const { return format_argument(value); }

    friend std::ostream& operator<<(std::ostream& out, const shell_literal& self) {
        out << self.str();
        return out;
    }
};

inline shell_literal literal(std::string_view s) noexcept { return shell_literal{s}; }
inline shell_literal literal(const char* s) noexcept { return shell_literal{s}; }

// A temporary string would be destroyed before the literal is formatted
shell_literal literal(std::string&&) = delete;

}  // namespace shlit

namespace fmt {
template <>
struct formatter<shlit::shell_literal> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const shlit::shell_literal& lit, FormatContext& ctx) const {
        return format_to(ctx.out(), "{}", lit.str());
    }
};
}  // namespace fmt
