// ZSwap scenario runner
//
// Replays a JSON list of operations against an in-memory venue and prints
// every committed event, query result and failure as one JSON line.

#include "zswap/zswap.hpp"
#include "zswap/config.hpp"
#include "zswap/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace zswap;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path;
    bool verbose = false;
};

// Default fee setter when the config names none
constexpr Address DEFAULT_OWNER = from_uint(1);

//------------------------------------------------------------------------------
// JSON helpers
//------------------------------------------------------------------------------

class ScenarioError : public std::runtime_error {
public:
    explicit ScenarioError(const std::string& msg) : std::runtime_error(msg) {}
};

Address address_field(const json& op, const char* name) {
    if (!op.contains(name)) {
        throw ScenarioError(std::string("missing field '") + name + "'");
    }
    auto text = op.at(name).get<std::string>();
    auto addr = from_hex(text);
    if (!addr) {
        throw ScenarioError(std::string("invalid address in '") + name + "': " + text);
    }
    return *addr;
}

Asset asset_field(const json& op, const char* name) {
    return Asset(address_field(op, name));
}

// Amounts may be JSON numbers or decimal strings (for values above 2^64)
Amount amount_field(const json& op, const char* name, std::optional<Amount> fallback = std::nullopt) {
    if (!op.contains(name)) {
        if (fallback) return *fallback;
        throw ScenarioError(std::string("missing field '") + name + "'");
    }
    const auto& value = op.at(name);
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        auto parsed = parse_u128(value.get<std::string>());
        if (parsed) return *parsed;
    }
    throw ScenarioError(std::string("invalid amount in '") + name + "': " + value.dump());
}

uint32_t rate_field(const json& op, const char* name) {
    if (!op.contains(name)) {
        throw ScenarioError(std::string("missing field '") + name + "'");
    }
    const auto& value = op.at(name);
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw ScenarioError(std::string("invalid rate in '") + name + "': " + value.dump());
    }
    return static_cast<uint32_t>(value.get<uint64_t>());
}

std::vector<Asset> path_field(const json& op) {
    if (!op.contains("path") || !op.at("path").is_array()) {
        throw ScenarioError("missing array field 'path'");
    }
    std::vector<Asset> path;
    for (const auto& hop : op.at("path")) {
        auto addr = from_hex(hop.get<std::string>());
        if (!addr) {
            throw ScenarioError("invalid address in 'path': " + hop.dump());
        }
        path.emplace_back(*addr);
    }
    return path;
}

json amounts_json(const std::vector<Amount>& amounts) {
    json out = json::array();
    for (Amount a : amounts) out.push_back(to_string(a));
    return out;
}

json pool_json(const PairKey& key, const Pool& pool) {
    return json{
        {"asset_low", key.low.to_hex()},
        {"asset_high", key.high.to_hex()},
        {"reserve_low", to_string(pool.reserve_low)},
        {"reserve_high", to_string(pool.reserve_high)},
        {"total_shares", to_string(pool.total_shares)}
    };
}

//------------------------------------------------------------------------------
// Event printer
//------------------------------------------------------------------------------

struct EventJsonVisitor {
    json operator()(const PairCreated& e) const {
        return {{"asset_low", e.low.to_hex()}, {"asset_high", e.high.to_hex()}};
    }
    json operator()(const LiquidityAdded& e) const {
        return {{"asset_low", e.pair.low.to_hex()}, {"asset_high", e.pair.high.to_hex()},
                {"depositor", to_hex(e.depositor)},
                {"amount_low", to_string(e.amount_low)}, {"amount_high", to_string(e.amount_high)},
                {"shares", to_string(e.shares)}};
    }
    json operator()(const LiquidityRemoved& e) const {
        return {{"asset_low", e.pair.low.to_hex()}, {"asset_high", e.pair.high.to_hex()},
                {"depositor", to_hex(e.depositor)},
                {"amount_low", to_string(e.amount_low)}, {"amount_high", to_string(e.amount_high)},
                {"shares", to_string(e.shares)}};
    }
    json operator()(const SwapExecuted& e) const {
        return {{"sender", to_hex(e.sender)}, {"recipient", to_hex(e.recipient)},
                {"asset_in", e.asset_in.to_hex()}, {"asset_out", e.asset_out.to_hex()},
                {"amount_in", to_string(e.amount_in)}, {"amount_out", to_string(e.amount_out)}};
    }
    json operator()(const FeeUpdated& e) const {
        return {{"old_rate", e.old_rate}, {"new_rate", e.new_rate}};
    }
};

class JsonLinePrinter : public EventListener {
public:
    void on_event(const Event& event) override {
        json line{
            {"event", event_name(event.payload)},
            {"sequence", event.sequence},
            {"data", std::visit(EventJsonVisitor{}, event.payload)}
        };
        std::cout << line.dump() << "\n";
    }
};

//------------------------------------------------------------------------------
// Scenario runner
//------------------------------------------------------------------------------

class ScenarioRunner {
public:
    explicit ScenarioRunner(const Config& config)
        : auth_(config.fees.fee_setter.value_or(DEFAULT_OWNER))
        , venue_(transfer_, auth_, config.fees.initial_fee_rate_bps)
    {
        venue_.events().subscribe(&printer_);
    }

    ~ScenarioRunner() {
        venue_.events().unsubscribe(&printer_);
    }

    // Returns the number of failed operations
    size_t run(const json& operations) {
        size_t failures = 0;
        size_t index = 0;
        for (const auto& op : operations) {
            std::string name = op.is_object() ? op.value("op", "") : "";
            try {
                run_one(name, op);
            } catch (const SwapError& e) {
                failures++;
                print_line({{"op", name}, {"index", index},
                            {"error", zswap::to_string(e.code())}, {"message", e.what()}});
            } catch (const ScenarioError& e) {
                failures++;
                print_line({{"op", name}, {"index", index},
                            {"error", "BAD_OPERATION"}, {"message", e.what()}});
            } catch (const json::exception& e) {
                failures++;
                print_line({{"op", name}, {"index", index},
                            {"error", "BAD_OPERATION"}, {"message", e.what()}});
            }
            index++;
        }
        return failures;
    }

private:
    InMemoryAssetTransfer transfer_;
    SingleOwnerAuthorization auth_;
    ZSwap venue_;
    JsonLinePrinter printer_;

    static void print_line(const json& line) {
        std::cout << line.dump() << "\n";
    }

    void run_one(const std::string& name, const json& op) {
        if (name == "mint") {
            transfer_.mint(asset_field(op, "asset"), address_field(op, "holder"),
                           amount_field(op, "amount"));
        } else if (name == "create_pair") {
            venue_.create_pair(asset_field(op, "asset_a"), asset_field(op, "asset_b"));
        } else if (name == "add_liquidity") {
            AddLiquidityParams params{
                asset_field(op, "asset_a"), asset_field(op, "asset_b"),
                amount_field(op, "amount_a"), amount_field(op, "amount_b"),
                amount_field(op, "amount_a_min", Amount(0)), amount_field(op, "amount_b_min", Amount(0)),
                address_field(op, "depositor")
            };
            auto result = venue_.add_liquidity(params);
            print_line({{"op", name}, {"amount_a", to_string(result.amount_a)},
                        {"amount_b", to_string(result.amount_b)},
                        {"shares", to_string(result.shares)}});
        } else if (name == "remove_liquidity") {
            RemoveLiquidityParams params{
                asset_field(op, "asset_a"), asset_field(op, "asset_b"),
                amount_field(op, "shares"),
                amount_field(op, "amount_a_min", Amount(0)), amount_field(op, "amount_b_min", Amount(0)),
                address_field(op, "depositor")
            };
            auto result = venue_.remove_liquidity(params);
            print_line({{"op", name}, {"amount_a", to_string(result.amount_a)},
                        {"amount_b", to_string(result.amount_b)}});
        } else if (name == "swap") {
            Address caller = address_field(op, "caller");
            Address recipient = op.contains("recipient") ? address_field(op, "recipient") : caller;
            auto result = venue_.swap(caller, amount_field(op, "amount_in"),
                                      amount_field(op, "amount_out_min", Amount(0)),
                                      path_field(op), recipient);
            print_line({{"op", name}, {"amounts", amounts_json(result.amounts)}});
        } else if (name == "set_fee_rate") {
            venue_.set_fee_rate(address_field(op, "caller"), rate_field(op, "rate"));
        } else if (name == "get_pool") {
            Asset a = asset_field(op, "asset_a");
            Asset b = asset_field(op, "asset_b");
            auto pool = venue_.get_pool(a, b);
            print_line({{"op", name},
                        {"pool", pool ? pool_json(PairKey::sorted(a, b), *pool) : json(nullptr)}});
        } else if (name == "get_position") {
            auto position = venue_.get_depositor_position(asset_field(op, "asset_a"),
                                                          asset_field(op, "asset_b"),
                                                          address_field(op, "depositor"));
            json body = nullptr;
            if (position) {
                body = {{"share_amount", to_string(position->share_amount)},
                        {"share_ratio", to_string(position->share_ratio)}};
            }
            print_line({{"op", name}, {"position", body}});
        } else if (name == "get_amounts_out") {
            auto amounts = venue_.get_amounts_out(amount_field(op, "amount_in"), path_field(op));
            print_line({{"op", name}, {"amounts", amounts_json(amounts)}});
        } else if (name == "get_amounts_in") {
            auto amounts = venue_.get_amounts_in(amount_field(op, "amount_out"), path_field(op));
            print_line({{"op", name}, {"amounts", amounts_json(amounts)}});
        } else if (name == "balance_of") {
            auto balance = transfer_.balance_of(asset_field(op, "asset"), address_field(op, "holder"));
            print_line({{"op", name}, {"balance", to_string(balance)}});
        } else if (name == "get_fee_rate") {
            print_line({{"op", name}, {"fee_rate", venue_.fee_rate()}});
        } else {
            throw ScenarioError("unknown operation '" + name + "'");
        }
    }
};

//------------------------------------------------------------------------------
// CLI Interface
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "ZSwap scenario runner\n\n"
              << "Usage: " << prog << " [options] <scenario.json>\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON config (log level, fee rate, fee setter)\n"
              << "  -v, --verbose        Debug logging (overrides config)\n"
              << "  -h, --help           Show this help message\n\n"
              << "Scenario: {\"operations\": [{\"op\": \"mint\", ...}, ...]} or a bare array.\n"
              << "Operations: mint, create_pair, add_liquidity, remove_liquidity, swap,\n"
              << "  set_fee_rate, get_pool, get_position, get_amounts_out, get_amounts_in,\n"
              << "  balance_of, get_fee_rate\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' && options.scenario_path.empty()) {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    if (options.scenario_path.empty()) {
        std::cerr << "No scenario specified. Use -h for help.\n";
        std::exit(1);
    }
    return options;
}

json load_operations(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ScenarioError("Cannot open scenario file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json root = json::parse(buffer.str());
    if (root.is_object() && root.contains("operations")) {
        root = root.at("operations");
    }
    if (!root.is_array()) {
        throw ScenarioError("Scenario must be an array or an object with 'operations'");
    }
    return root;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        Config config = options.config_path.empty() ? Config{}
                                                    : Config::from_file(options.config_path);
        if (options.verbose) {
            config.set_log_level("debug");
        }
        zswap::log::init(config.general.log_level);

        if (!config.fees.fee_setter) {
            spdlog::warn("no fee_setter configured, using {}", to_hex(DEFAULT_OWNER));
        }

        json operations = load_operations(options.scenario_path);
        ScenarioRunner runner(config);
        size_t failures = runner.run(operations);

        spdlog::info("scenario done: {} operations, {} failed", operations.size(), failures);
        return failures == 0 ? 0 : 2;
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    } catch (const ScenarioError& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
    } catch (const json::exception& e) {
        std::cerr << "Scenario JSON error: " << e.what() << "\n";
    } catch (const SwapError& e) {
        std::cerr << "Venue error: " << e.what() << "\n";
    }
    return 1;
}
