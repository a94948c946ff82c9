#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <optional>
#include <string>

namespace quarry {
namespace log {

/**
 * @brief Map a textual level name to an spdlog level
 *
 * Accepts trace, debug, info, warn, error and off.
 *
 * @return std::nullopt for anything else
 */
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

/**
 * @brief Create a named stderr logger
 *
 * The logger is not registered globally; ownership belongs to whoever
 * injects it into the components.
 */
inline std::shared_ptr<spdlog::logger> make_logger(
    const std::string& name,
    spdlog::level::level_enum level = spdlog::level::info
) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    return logger;
}

/// Injected logger, or the process default logger when none was given.
inline std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        return logger;
    }
    return spdlog::default_logger();
}

/// Shortened id used in log lines.
inline std::string short_id(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

} // namespace log
} // namespace quarry
