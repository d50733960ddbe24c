#ifndef ZSWAP_LOG_HPP
#define ZSWAP_LOG_HPP

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace zswap {
namespace log {

// "trace", "debug", "info", "warn", "error", "critical", "off"
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

// Installs a colored stderr logger named "zswap" as the spdlog default.
// Throws ConfigError for an unknown level name.
void init(std::string_view level = "info");

} // namespace log
} // namespace zswap

#endif // ZSWAP_LOG_HPP
