#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace turnkey {
namespace log {

inline constexpr const char* kLoggerName = "turnkey";

/**
 * @brief Shared library logger, created on first use.
 *
 * Reuses a logger already registered under the same name so an application
 * can install its own sinks before calling into the library.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stdout_color_mt(kLoggerName);
        created->set_pattern("%^[%l]%$ %v");
        return created;
    }();
    return instance;
}

/** @brief Set the level from a name such as "debug" or "warn"; unknown names leave it unchanged. */
inline void set_level(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        return;
    }
    logger()->set_level(level);
}

} // namespace log
} // namespace turnkey
