// =============================================================================
// zswap.cpp - Transaction orchestration for the constant-product venue
// =============================================================================

#include "zswap/zswap.hpp"
#include "zswap/log.hpp"

#include <algorithm>
#include <set>

namespace zswap {

// =============================================================================
// Constructor
// =============================================================================

ZSwap::ZSwap(IAssetTransfer& transfer, const IAuthorization& auth, uint32_t initial_fee_rate)
    : transfer_(transfer), auth_(auth), ledger_(initial_fee_rate) {
    if (initial_fee_rate > MAX_FEE_RATE_BPS) {
        throw SwapError(ErrorCode::FeeTooHigh, std::to_string(initial_fee_rate));
    }
}

// =============================================================================
// Operation Guard
// =============================================================================

ZSwap::OperationGuard::OperationGuard(ZSwap& owner, const char* operation) : owner_(owner) {
    if (owner_.writer_.load() == std::this_thread::get_id()) {
        spdlog::warn("{} rejected: re-entrant call", operation);
        throw SwapError(ErrorCode::ReentrantCall, operation);
    }
    lock_ = std::unique_lock<std::mutex>(owner_.write_mutex_);
    owner_.writer_.store(std::this_thread::get_id());
}

ZSwap::OperationGuard::~OperationGuard() {
    owner_.writer_.store(std::thread::id());
}

// =============================================================================
// Commit Pipeline
// =============================================================================

void ZSwap::execute(const char* operation, const StageFn& stage) {
    std::vector<Event> committed;
    {
        OperationGuard guard(*this, operation);
        LedgerTxn txn(ledger_);
        try {
            stage(txn);
            settle(txn.transfers());
        } catch (const SwapError& e) {
            aborted_operations_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("{} aborted: {}", operation, e.what());
            throw;
        }
        ledger_.apply(txn);
        committed = events_.append(txn.take_events());
    }

    // Outside the guard: listeners may issue follow-up operations
    events_.notify(committed);
}

void ZSwap::settle(const std::vector<StagedTransfer>& transfers) {
    std::vector<StagedTransfer> ordered(transfers);
    std::stable_partition(ordered.begin(), ordered.end(), [](const StagedTransfer& t) {
        return t.kind == StagedTransfer::Kind::Pull;
    });

    std::vector<StagedTransfer> completed;
    for (const auto& t : ordered) {
        if (t.amount == 0) continue;
        try {
            if (t.kind == StagedTransfer::Kind::Pull) {
                transfer_.pull(t.asset, t.holder, t.amount);
            } else {
                transfer_.push(t.asset, t.holder, t.amount);
            }
        } catch (...) {
            reverse(completed);
            throw;
        }
        completed.push_back(t);
    }
}

void ZSwap::reverse(const std::vector<StagedTransfer>& completed) {
    size_t failures = 0;
    std::string first_error;
    for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
        try {
            if (it->kind == StagedTransfer::Kind::Pull) {
                transfer_.push(it->asset, it->holder, it->amount);
            } else {
                transfer_.pull(it->asset, it->holder, it->amount);
            }
        } catch (const std::exception& e) {
            spdlog::critical("reversing {} of {} {} for {} failed: {}",
                             it->kind == StagedTransfer::Kind::Pull ? "pull" : "push",
                             to_string(it->amount), it->asset.to_hex(), to_hex(it->holder),
                             e.what());
            if (failures++ == 0) first_error = e.what();
        }
    }
    if (failures > 0) {
        throw SwapError(ErrorCode::TransferFailed,
                        "reversal failed (" + std::to_string(failures) + " of " +
                        std::to_string(completed.size()) + "): " + first_error);
    }
}

// =============================================================================
// Pair Creation
// =============================================================================

PairKey ZSwap::create_pair(const Asset& asset_a, const Asset& asset_b) {
    PairKey key;
    execute("create_pair", [&](LedgerTxn& txn) {
        key = txn.create_pair(asset_a, asset_b);
    });

    spdlog::info("pair created {} / {}", key.low.to_hex(), key.high.to_hex());
    return key;
}

// =============================================================================
// Liquidity
// =============================================================================

AddLiquidityResult ZSwap::add_liquidity(const AddLiquidityParams& params) {
    AddLiquidityResult result{};
    execute("add_liquidity", [&](LedgerTxn& txn) {
        result = txn.add_liquidity(params);
    });
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    spdlog::info("liquidity added by {}: {} {} + {} {} -> {} shares",
                 to_hex(params.depositor),
                 to_string(result.amount_a), params.asset_a.to_hex(),
                 to_string(result.amount_b), params.asset_b.to_hex(),
                 to_string(result.shares));
    return result;
}

RemoveLiquidityResult ZSwap::remove_liquidity(const RemoveLiquidityParams& params) {
    RemoveLiquidityResult result{};
    execute("remove_liquidity", [&](LedgerTxn& txn) {
        result = txn.remove_liquidity(params);
    });
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    spdlog::info("liquidity removed by {}: {} shares -> {} {} + {} {}",
                 to_hex(params.depositor), to_string(params.shares),
                 to_string(result.amount_a), params.asset_a.to_hex(),
                 to_string(result.amount_b), params.asset_b.to_hex());
    return result;
}

// =============================================================================
// Multi-hop Swap
// =============================================================================

void ZSwap::validate_path(const std::vector<Asset>& path) {
    if (path.size() < 2) {
        throw SwapError(ErrorCode::InvalidPath, "path needs at least 2 assets");
    }
    std::set<Asset> seen(path.begin(), path.end());
    if (seen.size() != path.size()) {
        throw SwapError(ErrorCode::InvalidPath, "path repeats an asset");
    }
}

SwapResult ZSwap::swap(const Address& caller, Amount amount_in, Amount amount_out_min,
                       const std::vector<Asset>& path, const Address& recipient) {
    SwapResult result;
    execute("swap", [&](LedgerTxn& txn) {
        validate_path(path);
        if (amount_in == 0) {
            throw SwapError(ErrorCode::InvalidAmount, "amount_in must be positive");
        }
        if (is_null(caller) || is_null(recipient)) {
            throw SwapError(ErrorCode::InvalidAddress, "caller and recipient must not be null");
        }

        txn.stage_pull(path.front(), caller, amount_in);

        result.amounts.assign(1, amount_in);
        Amount hop_amount = amount_in;
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            Amount out = txn.swap_hop(path[i], path[i + 1], hop_amount, caller, recipient);
            spdlog::debug("swap hop {}: {} {} -> {} {}", i,
                          to_string(hop_amount), path[i].to_hex(),
                          to_string(out), path[i + 1].to_hex());
            result.amounts.push_back(out);
            hop_amount = out;
        }

        if (hop_amount < amount_out_min) {
            throw SwapError(ErrorCode::InsufficientOutputAmount,
                            to_string(hop_amount) + " < " + to_string(amount_out_min));
        }
        txn.stage_push(path.back(), recipient, hop_amount);
    });
    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    total_hops_.fetch_add(path.size() - 1, std::memory_order_relaxed);

    spdlog::info("swap by {}: {} {} -> {} {} to {} ({} hops)",
                 to_hex(caller), to_string(amount_in), path.front().to_hex(),
                 to_string(result.amount_out()), path.back().to_hex(),
                 to_hex(recipient), path.size() - 1);
    return result;
}

// =============================================================================
// Administration
// =============================================================================

void ZSwap::set_fee_rate(const Address& caller, uint32_t new_rate) {
    uint32_t old_rate = 0;
    execute("set_fee_rate", [&](LedgerTxn& txn) {
        auth_.require_role(caller, Role::FeeSetter);
        old_rate = txn.fee_rate();
        txn.set_fee_rate(new_rate);
    });

    spdlog::info("fee rate {} -> {} bps by {}", old_rate, new_rate, to_hex(caller));
}

// =============================================================================
// Route Quotes
// =============================================================================

std::vector<Amount> ZSwap::get_amounts_out(Amount amount_in, const std::vector<Asset>& path) const {
    validate_path(path);
    uint32_t fee = fee_rate();

    std::vector<Amount> amounts;
    amounts.reserve(path.size());
    amounts.push_back(amount_in);
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        PairKey key = PairKey::canonical(path[i], path[i + 1]);
        auto pool = ledger_.get_pool(key);
        if (!pool) {
            throw SwapError(ErrorCode::PairDoesNotExist,
                            key.low.to_hex() + "/" + key.high.to_hex());
        }
        auto [reserve_in, reserve_out] = pool->reserves_for(key, path[i]);
        amounts.push_back(pricing::compute_swap_output(amounts.back(), reserve_in, reserve_out, fee));
    }
    return amounts;
}

std::vector<Amount> ZSwap::get_amounts_in(Amount amount_out, const std::vector<Asset>& path) const {
    validate_path(path);
    uint32_t fee = fee_rate();

    std::vector<Amount> amounts(path.size(), 0);
    amounts.back() = amount_out;
    for (size_t i = path.size() - 1; i > 0; --i) {
        PairKey key = PairKey::canonical(path[i - 1], path[i]);
        auto pool = ledger_.get_pool(key);
        if (!pool) {
            throw SwapError(ErrorCode::PairDoesNotExist,
                            key.low.to_hex() + "/" + key.high.to_hex());
        }
        auto [reserve_in, reserve_out] = pool->reserves_for(key, path[i - 1]);
        amounts[i - 1] = pricing::compute_swap_input(amounts[i], reserve_in, reserve_out, fee);
    }
    return amounts;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Pool> ZSwap::get_pool(const Asset& asset_a, const Asset& asset_b) const {
    return ledger_.get_pool(PairKey::sorted(asset_a, asset_b));
}

std::optional<DepositorPosition> ZSwap::get_depositor_position(const Asset& asset_a,
                                                               const Asset& asset_b,
                                                               const Address& depositor) const {
    return ledger_.get_position(PairKey::sorted(asset_a, asset_b), depositor);
}

ZSwap::Stats ZSwap::get_stats() const {
    return Stats{
        static_cast<uint64_t>(ledger_.pair_count()),
        total_swaps_.load(std::memory_order_relaxed),
        total_hops_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed),
        aborted_operations_.load(std::memory_order_relaxed)
    };
}

} // namespace zswap
