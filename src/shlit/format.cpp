#include "./format.hpp"

#include "./classify.hpp"
#include "./utf8.hpp"

#include <shlit/error/errors.hpp>

#include <boost/leaf/error.hpp>
#include <boost/leaf/exception.hpp>

#include <optional>

using namespace shlit;

namespace {

struct arg_problem {
    errc        ec;
    std::size_t offset;
};

/// Check an argument in the order that errors are reported: first for text, then for NUL
std::optional<arg_problem> check_argument(std::string_view arg) noexcept {
    if (auto bad = utf8::find_ill_formed(arg)) {
        return arg_problem{errc::arg_not_text, *bad};
    }
    if (auto nul = arg.find('\0'); nul != arg.npos) {
        return arg_problem{errc::arg_contains_nul, nul};
    }
    return std::nullopt;
}

std::string quote(std::string_view arg) {
    std::string ret;
    ret.reserve(arg.size() + 2);
    ret.push_back('\'');
    for (char c : arg) {
        if (c == '\'') {
            // Close the quote, emit an escaped quote, and reopen
            ret.append("'\\''");
        } else {
            ret.push_back(c);
        }
    }
    ret.push_back('\'');
    return ret;
}

std::string format_checked(std::string_view arg) {
    if (!needs_quoting(arg)) {
        return std::string(arg);
    }
    return quote(arg);
}

}  // namespace

std::string shlit::format_argument(std::string_view arg) {
    auto problem = check_argument(arg);
    if (!problem) {
        return format_checked(arg);
    }
    if (problem->ec == errc::arg_not_text) {
        BOOST_LEAF_THROW_EXCEPTION(arg_type_error{},
                                   e_invalid_utf8{problem->offset},
                                   e_shell_arg{std::string(arg)});
    }
    BOOST_LEAF_THROW_EXCEPTION(arg_value_error{},
                               e_nul_offset{problem->offset},
                               e_shell_arg{std::string(arg)});
}

std::string shlit::format_argument(const char* arg) {
    if (arg == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(arg_type_error{});
    }
    return format_argument(std::string_view(arg));
}

boost::leaf::result<std::string> shlit::try_format_argument(std::string_view arg) {
    auto problem = check_argument(arg);
    if (!problem) {
        return format_checked(arg);
    }
    if (problem->ec == errc::arg_not_text) {
        return BOOST_LEAF_NEW_ERROR(problem->ec,
                                    e_invalid_utf8{problem->offset},
                                    e_shell_arg{std::string(arg)});
    }
    return BOOST_LEAF_NEW_ERROR(problem->ec,
                                e_nul_offset{problem->offset},
                                e_shell_arg{std::string(arg)});
}
