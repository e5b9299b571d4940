#include "./env.hpp"

#include <neo/utility.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

std::optional<std::string> shlit::getenv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

bool shlit::getenv_bool(const std::string& name) {
    auto value = shlit::getenv(name);
    if (!value) {
        return false;
    }
    std::ranges::transform(*value, value->begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return *value == neo::oper::any_of("1", "yes", "on", "true");
}
