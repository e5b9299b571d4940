#include "./log.hpp"

#include <shlit/util/env.hpp>

#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace {

struct level_info {
    std::string_view          name;
    shlit::log::level         lvl;
    spdlog::level::level_enum spdlog_level;
};

constexpr std::array<level_info, 7> level_table = {{
    {"trace", shlit::log::level::trace, spdlog::level::trace},
    {"debug", shlit::log::level::debug, spdlog::level::debug},
    {"info", shlit::log::level::info, spdlog::level::info},
    {"warn", shlit::log::level::warn, spdlog::level::warn},
    {"error", shlit::log::level::error, spdlog::level::err},
    {"critical", shlit::log::level::critical, spdlog::level::critical},
    {"silent", shlit::log::level::silent, spdlog::level::off},
}};

const level_info* find_level(shlit::log::level l) noexcept {
    auto it = std::ranges::find(level_table, l, &level_info::lvl);
    return it == level_table.end() ? nullptr : &*it;
}

}  // namespace

std::optional<shlit::log::level> shlit::log::parse_log_level(std::string_view name) noexcept {
    auto it = std::ranges::find(level_table, name, &level_info::name);
    if (it == level_table.end()) {
        return std::nullopt;
    }
    return it->lvl;
}

std::string_view shlit::log::level_name(shlit::log::level l) noexcept {
    auto info = find_level(l);
    return info ? info->name : "<invalid>";
}

void shlit::log::init_logger() {
    spdlog::set_pattern(shlit::getenv_bool("SHLIT_LOG_NO_COLOR") ? "[%-5l] %v" : "[%^%-5l%$] %v");

    auto level_str = shlit::getenv("SHLIT_LOG_LEVEL");
    if (!level_str) {
        return;
    }
    if (auto lvl = parse_log_level(*level_str)) {
        current_log_level = *lvl;
    } else {
        shlit_log(warn, "Ignoring unknown SHLIT_LOG_LEVEL '{}'", *level_str);
    }
}

void shlit::log::log_print(shlit::log::level l, std::string_view msg) noexcept {
    auto info = find_level(l);
    neo_assert_always(invariant, info != nullptr, "Invalid log level", msg, int(l));

    // current_log_level does the filtering, so spdlog must pass everything it is handed
    auto logger = spdlog::default_logger_raw();
    if (logger->level() != spdlog::level::trace) {
        logger->set_level(spdlog::level::trace);
    }
    logger->log(info->spdlog_level, "{}", msg);
}
