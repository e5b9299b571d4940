#pragma once

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace shlit::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Set the output pattern of the default logger and apply the SHLIT_LOG_LEVEL and
 * SHLIT_LOG_NO_COLOR environment settings.
 */
void init_logger();

/**
 * @brief Look up a log level by its name ("trace", "debug", "info", "warn", "error",
 * "critical", or "silent"). Returns nullopt for an unknown name.
 */
std::optional<level> parse_log_level(std::string_view name) noexcept;

std::string_view level_name(level l) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        log_print(l, fmt::format(fmt::runtime(s), args...));
    }
}

#define shlit_log(Level, str, ...)                                                                 \
    do {                                                                                           \
        if (::shlit::log::level_enabled(::shlit::log::level::Level)) {                             \
            ::shlit::log::log(::shlit::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                                          \
    } while (0)

}  // namespace shlit::log
