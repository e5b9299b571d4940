#pragma once

#include <boost/leaf/result.hpp>

#include <string>
#include <string_view>

namespace shlit {

/**
 * @brief Render a string as a literal that a POSIX shell reads back as exactly one word equal to
 * the original string.
 *
 * Strings that need no quoting (see needs_quoting()) are returned unchanged. Other strings are
 * wrapped in single quotes, with each embedded single quote written as '\''.
 *
 * The result is meant for display: log messages, documentation, command previews. It makes no
 * attempt to protect a program from arguments that look like options.
 *
 * @param arg A UTF-8 encoded string.
 * @throws shlit::arg_type_error if `arg` is not well-formed UTF-8.
 * @throws shlit::arg_value_error if `arg` contains a NUL character.
 *
 * The exceptions carry an e_shell_arg with the rejected string, and an e_invalid_utf8 or an
 * e_nul_offset giving the position of the problem.
 */
std::string format_argument(std::string_view arg);

/**
 * @brief Overload for C strings.
 *
 * @throws shlit::arg_type_error if `arg` is a null pointer.
 */
std::string format_argument(const char* arg);

/**
 * @brief Non-throwing version of format_argument().
 *
 * On failure the error carries the shlit::errc value for the failure along with the same error
 * objects that format_argument() would attach to its exception.
 */
boost::leaf::result<std::string> try_format_argument(std::string_view arg);

}  // namespace shlit
