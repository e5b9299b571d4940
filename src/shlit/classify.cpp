#include "./classify.hpp"

#include "./utf8.hpp"

#include <unicode/uchar.h>

using namespace shlit;

std::string_view shlit::to_string(quote_reason r) noexcept {
    switch (r) {
    case quote_reason::none:
        return "none";
    case quote_reason::empty:
        return "empty string";
    case quote_reason::leading_tilde:
        return "leading tilde";
    case quote_reason::whitespace:
        return "whitespace";
    case quote_reason::control_char:
        return "control character";
    case quote_reason::metachar:
        return "shell metacharacter";
    }
    return "<invalid quote_reason>";
}

bool shlit::is_unicode_whitespace(char32_t c) noexcept {
    return u_isUWhiteSpace(static_cast<UChar32>(c)) != 0;
}

bool shlit::has_unicode_whitespace(std::string_view s) noexcept {
    return utf8::any_code_point(s, is_unicode_whitespace);
}

bool shlit::has_ascii_control(std::string_view s) noexcept {
    // Every code point in this range is a single byte, and no byte of a multi-byte sequence
    // falls below 0x80
    for (char c : s) {
        if (is_ascii_control(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

bool shlit::has_shell_metachar(std::string_view s) noexcept {
    for (char c : s) {
        if (is_shell_metachar(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

quote_reason shlit::quoting_reason(std::string_view s) noexcept {
    if (s.empty()) {
        return quote_reason::empty;
    }
    if (starts_with_tilde(s)) {
        return quote_reason::leading_tilde;
    }

    // Whitespace outranks the other triggers, so the scan can only stop early when it finds some.
    // Otherwise remember the highest-ranked trigger seen so far.
    auto found = quote_reason::none;
    auto note  = [&](quote_reason r) {
        if (found == quote_reason::none || r < found) {
            found = r;
        }
    };
    bool any_space = utf8::any_code_point(s, [&](char32_t c) {
        if (is_unicode_whitespace(c)) {
            return true;
        }
        if (is_ascii_control(c)) {
            note(quote_reason::control_char);
        } else if (is_shell_metachar(c)) {
            note(quote_reason::metachar);
        }
        return false;
    });
    if (any_space) {
        return quote_reason::whitespace;
    }
    return found;
}
