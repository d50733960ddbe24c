// =============================================================================
// config.cpp - JSON configuration
// =============================================================================

#include "zswap/config.hpp"
#include "zswap/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace zswap {

using json = nlohmann::json;

namespace {

// Reads a non-negative integer that must fit in 32 bits; nlohmann's own
// conversion would truncate silently
uint32_t read_u32(const json& section, const char* name, uint32_t fallback) {
    if (!section.contains(name)) return fallback;
    const auto& value = section.at(name);
    if (!value.is_number_unsigned()) {
        throw ConfigError(std::string(name) + " must be a non-negative integer, got " +
                          value.dump());
    }
    uint64_t wide = value.get<uint64_t>();
    if (wide > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError(std::string(name) + " out of range: " + std::to_string(wide));
    }
    return static_cast<uint32_t>(wide);
}

} // anonymous namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid config JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    Config config;
    try {
        if (root.contains("general")) {
            const auto& general = root.at("general");
            config.general.log_level = general.value("log_level", config.general.log_level);
        }

        if (root.contains("fees")) {
            const auto& fees = root.at("fees");
            config.fees.initial_fee_rate_bps =
                read_u32(fees, "initial_fee_rate_bps", config.fees.initial_fee_rate_bps);

            if (fees.contains("fee_setter")) {
                auto text = fees.at("fee_setter").get<std::string>();
                auto addr = from_hex(text);
                if (!addr) {
                    throw ConfigError("Invalid fee_setter address: " + text);
                }
                config.fees.fee_setter = *addr;
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (!log::parse_level(general.log_level)) {
        throw ConfigError("Unknown log level: " + general.log_level);
    }
    if (fees.initial_fee_rate_bps > MAX_FEE_RATE_BPS) {
        throw ConfigError("initial_fee_rate_bps " + std::to_string(fees.initial_fee_rate_bps) +
                          " exceeds " + std::to_string(MAX_FEE_RATE_BPS));
    }
    if (fees.fee_setter && is_null(*fees.fee_setter)) {
        throw ConfigError("fee_setter must not be the null address");
    }
}

} // namespace zswap
