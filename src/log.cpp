// =============================================================================
// log.cpp - spdlog setup
// =============================================================================

#include "zswap/log.hpp"
#include "zswap/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace zswap {
namespace log {

std::optional<spdlog::level::level_enum> parse_level(std::string_view name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

void init(std::string_view level) {
    auto parsed = parse_level(level);
    if (!parsed) {
        throw ConfigError("Unknown log level: " + std::string(level));
    }

    auto logger = spdlog::get("zswap");
    if (!logger) {
        logger = spdlog::stderr_color_mt("zswap");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(*parsed);
    spdlog::set_default_logger(logger);
}

} // namespace log
} // namespace zswap
