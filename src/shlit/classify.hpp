#pragma once

#include <string_view>

namespace shlit {

/**
 * @brief The reason that a string must be quoted to be read back as a single shell word.
 *
 * When more than one reason applies, the first one in declaration order is reported.
 */
enum class quote_reason {
    /// The string is a safe bare word
    none,
    /// The empty string would vanish without quotes
    empty,
    /// A leading '~' would undergo tilde expansion
    leading_tilde,
    /// The string contains a code point with the Unicode White_Space property
    whitespace,
    /// The string contains an ASCII control character (U+0001-U+001F or U+007F)
    control_char,
    /// The string contains a shell metacharacter
    metachar,
};

std::string_view to_string(quote_reason) noexcept;

/// Whether `c` has the Unicode White_Space property
bool is_unicode_whitespace(char32_t c) noexcept;

/// Whether `c` is U+0001-U+001F or U+007F. NUL is not included.
constexpr bool is_ascii_control(char32_t c) noexcept {
    return (c >= 0x01 && c <= 0x1f) || c == 0x7f;
}

/**
 * @brief Whether `c` is one of the characters that the shell treats specially anywhere in a word:
 *
 *      ' " \ $ ` | & ; < > ( ) * ? [ ] { } ! #
 */
constexpr bool is_shell_metachar(char32_t c) noexcept {
    switch (c) {
    case U'\'':
    case U'"':
    case U'\\':
    case U'$':
    case U'`':
    case U'|':
    case U'&':
    case U';':
    case U'<':
    case U'>':
    case U'(':
    case U')':
    case U'*':
    case U'?':
    case U'[':
    case U']':
    case U'{':
    case U'}':
    case U'!':
    case U'#':
        return true;
    default:
        return false;
    }
}

inline bool starts_with_tilde(std::string_view s) noexcept { return !s.empty() && s.front() == '~'; }

/**
 * The string predicates below decode `s` as UTF-8 and skip ill-formed bytes. Callers that need to
 * reject ill-formed input should check it with utf8::find_ill_formed() first.
 */
bool has_unicode_whitespace(std::string_view s) noexcept;
bool has_ascii_control(std::string_view s) noexcept;
bool has_shell_metachar(std::string_view s) noexcept;

/**
 * @brief Determine why `s` requires quoting, or quote_reason::none if it can be shown as-is.
 */
quote_reason quoting_reason(std::string_view s) noexcept;

inline bool needs_quoting(std::string_view s) noexcept {
    return quoting_reason(s) != quote_reason::none;
}

}  // namespace shlit
