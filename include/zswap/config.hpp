#ifndef ZSWAP_CONFIG_HPP
#define ZSWAP_CONFIG_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

namespace zswap {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Fee governance settings
struct FeeConfig {
    uint32_t initial_fee_rate_bps = DEFAULT_FEE_RATE_BPS;
    std::optional<Address> fee_setter;
};

// =============================================================================
// Config - loaded from JSON:
//
//   {
//     "general": { "log_level": "debug" },
//     "fees":    { "initial_fee_rate_bps": 30,
//                  "fee_setter": "0x00000000000000000000000000000000000000aa" }
//   }
// =============================================================================

class Config {
public:
    GeneralConfig general;
    FeeConfig fees;

    Config() = default;

    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    // Throws ConfigError on an unknown log level or a fee above the ceiling
    void validate() const;

    // Builder methods
    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_initial_fee_rate(uint32_t bps) {
        fees.initial_fee_rate_bps = bps;
        return *this;
    }

    Config& with_fee_setter(const Address& owner) {
        fees.fee_setter = owner;
        return *this;
    }
};

} // namespace zswap

#endif // ZSWAP_CONFIG_HPP
