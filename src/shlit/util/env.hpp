#pragma once

#include <optional>
#include <string>

namespace shlit {

/**
 * @brief Read a configuration variable from the environment. A variable that is set to an empty
 * string counts as unset.
 */
std::optional<std::string> getenv(const std::string& name);

/**
 * @brief Check a switch-like variable. "1", "yes", "on" and "true" enable it, in any letter case.
 */
bool getenv_bool(const std::string& name);

}  // namespace shlit
