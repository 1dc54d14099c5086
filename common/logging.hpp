#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace polycurve {
namespace logging {

constexpr const char* LOGGER_NAME = "polycurve";
constexpr const char* LEVEL_ENV = "POLYCURVE_LOG_LEVEL";

// trace, debug, info, warn, error, off; anything else is unknown
inline std::optional<spdlog::level::level_enum> level_from_name(const std::string& name) {
    static const std::pair<const char*, spdlog::level::level_enum> levels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off}
    };
    for (const auto& [level_name, level] : levels) {
        if (name == level_name) {
            return level;
        }
    }
    return std::nullopt;
}

// Shared stderr logger. Level comes from POLYCURVE_LOG_LEVEL, default info.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto level = spdlog::level::info;
        if (const char* level_env = std::getenv(LEVEL_ENV)) {
            level = level_from_name(level_env).value_or(spdlog::level::info);
        }
        log->set_level(level);
        return log;
    }();
    return logger;
}

// -v on the command line: at least debug, never quieter than the environment asked for
inline void enable_verbose() {
    auto log = get_logger();
    if (log->level() > spdlog::level::debug) {
        log->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace polycurve
