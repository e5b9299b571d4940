#include "./errors.hpp"

#include <shlit/util/log.hpp>

#include <cassert>
#include <exception>

using namespace shlit;

#define BUG_STRING_SUFFIX " <- (Seeing this text is a `shlit` bug. Please report it.)"

std::string_view shlit::default_error_string(errc ec) noexcept {
    switch (ec) {
    case errc::arg_not_text:
        return "arg must be a string";
    case errc::arg_contains_nul:
        return "arg must not include NUL (\\u0000)";
    case errc::none:
        return "No error" BUG_STRING_SUFFIX;
    }
    assert(false && "Unexpected execution path during error message creation. This is a shlit bug");
    std::terminate();
}

std::string_view shlit::error_kind_name(errc ec) noexcept {
    switch (ec) {
    case errc::arg_not_text:
        return "TypeKind";
    case errc::arg_contains_nul:
        return "ValueKind";
    case errc::none:
        break;
    }
    assert(false && "Unexpected execution path during error kind naming. This is a shlit bug");
    std::terminate();
}

void e_shell_arg::log_error(errc ec) const noexcept {
    // Show control characters and invalid bytes as escapes rather than writing them to the log
    shlit_log(error, "{}: {:?}", default_error_string(ec), value);
}
