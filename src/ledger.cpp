// =============================================================================
// ledger.cpp - Pair ledger and staged transactions
// =============================================================================

#include "zswap/ledger.hpp"
#include "zswap/pricing.hpp"
#include "zswap/errors.hpp"

#include <mutex>

namespace zswap {

namespace {

void require_reserve_fits(Amount current, Amount delta) {
    if (delta > MAX_RESERVE || current > MAX_RESERVE - delta) {
        throw SwapError(ErrorCode::ReserveOverflow,
                        to_string(current) + " + " + to_string(delta));
    }
}

} // anonymous namespace

// =============================================================================
// PairLedger
// =============================================================================

PairLedger::PairLedger(uint32_t fee_rate) : fee_rate_(fee_rate) {}

std::optional<Pool> PairLedger::get_pool(const PairKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(key);
    return it != pools_.end() ? std::optional{it->second} : std::nullopt;
}

std::optional<DepositorPosition> PairLedger::get_position(const PairKey& key,
                                                          const Address& depositor) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(PositionKey{key, depositor});
    return it != positions_.end() ? std::optional{it->second} : std::nullopt;
}

uint32_t PairLedger::fee_rate() const {
    std::shared_lock lock(mutex_);
    return fee_rate_;
}

std::vector<PairKey> PairLedger::pairs() const {
    std::shared_lock lock(mutex_);
    return pair_order_;
}

size_t PairLedger::pair_count() const {
    std::shared_lock lock(mutex_);
    return pair_order_.size();
}

void PairLedger::apply(const LedgerTxn& txn) {
    std::unique_lock lock(mutex_);

    for (const auto& [key, pool] : txn.pools_) {
        pools_[key] = pool;
    }
    pair_order_.insert(pair_order_.end(), txn.created_.begin(), txn.created_.end());
    for (const auto& [key, position] : txn.positions_) {
        positions_[key] = position;
    }
    if (txn.fee_rate_) {
        fee_rate_ = *txn.fee_rate_;
    }
}

// =============================================================================
// LedgerTxn - Reads
// =============================================================================

LedgerTxn::LedgerTxn(const PairLedger& base) : base_(base) {}

std::optional<Pool> LedgerTxn::pool(const PairKey& key) const {
    auto it = pools_.find(key);
    if (it != pools_.end()) return it->second;
    return base_.get_pool(key);
}

DepositorPosition LedgerTxn::position(const PairKey& key, const Address& depositor) const {
    auto it = positions_.find(PositionKey{key, depositor});
    if (it != positions_.end()) return it->second;
    return base_.get_position(key, depositor).value_or(DepositorPosition{});
}

uint32_t LedgerTxn::fee_rate() const {
    return fee_rate_ ? *fee_rate_ : base_.fee_rate();
}

Pool& LedgerTxn::stage_pool(const PairKey& key) {
    auto it = pools_.find(key);
    if (it != pools_.end()) return it->second;

    auto committed = base_.get_pool(key);
    if (!committed || !committed->exists) {
        throw SwapError(ErrorCode::PairDoesNotExist,
                        key.low.to_hex() + "/" + key.high.to_hex());
    }
    return pools_.emplace(key, *committed).first->second;
}

DepositorPosition& LedgerTxn::stage_position(const PairKey& key, const Address& depositor) {
    PositionKey pos_key{key, depositor};
    auto it = positions_.find(pos_key);
    if (it != positions_.end()) return it->second;
    return positions_.emplace(pos_key, position(key, depositor)).first->second;
}

void LedgerTxn::refresh_ratio(const PairKey& key, const Address& depositor) {
    const Pool& staged = stage_pool(key);
    DepositorPosition& pos = stage_position(key, depositor);
    pos.share_ratio = pricing::share_ratio(pos.share_amount, staged.total_shares);
}

// =============================================================================
// LedgerTxn - Pair Creation
// =============================================================================

PairKey LedgerTxn::create_pair(const Asset& asset_a, const Asset& asset_b) {
    PairKey key = PairKey::canonical(asset_a, asset_b);

    auto existing = pool(key);
    if (existing && existing->exists) {
        throw SwapError(ErrorCode::PairExists, key.low.to_hex() + "/" + key.high.to_hex());
    }

    Pool fresh{};
    fresh.exists = true;
    pools_[key] = fresh;
    created_.push_back(key);

    events_.emplace_back(PairCreated{key.low, key.high});
    return key;
}

// =============================================================================
// LedgerTxn - Liquidity
// =============================================================================

AddLiquidityResult LedgerTxn::add_liquidity(const AddLiquidityParams& params) {
    PairKey key = PairKey::canonical(params.asset_a, params.asset_b);
    if (is_null(params.depositor)) {
        throw SwapError(ErrorCode::InvalidAddress, "depositor must not be null");
    }
    if (params.amount_a_desired == 0 || params.amount_b_desired == 0) {
        throw SwapError(ErrorCode::InvalidAmount, "desired amounts must be positive");
    }

    Pool& staged = stage_pool(key);
    auto [reserve_a, reserve_b] = staged.reserves_for(key, params.asset_a);

    // Amounts that preserve the current price
    Amount amount_a = params.amount_a_desired;
    Amount amount_b = params.amount_b_desired;
    if (reserve_a != 0 || reserve_b != 0) {
        Amount b_optimal = pricing::quote(params.amount_a_desired, reserve_a, reserve_b);
        if (b_optimal <= params.amount_b_desired) {
            if (b_optimal < params.amount_b_min) {
                throw SwapError(ErrorCode::InsufficientAmount,
                                "B: " + to_string(b_optimal) + " < " + to_string(params.amount_b_min));
            }
            amount_b = b_optimal;
        } else {
            Amount a_optimal = pricing::quote(params.amount_b_desired, reserve_b, reserve_a);
            if (a_optimal > params.amount_a_desired) {
                throw SwapError(ErrorCode::ExcessiveInput,
                                "A: " + to_string(a_optimal) + " > " + to_string(params.amount_a_desired));
            }
            if (a_optimal < params.amount_a_min) {
                throw SwapError(ErrorCode::InsufficientAmount,
                                "A: " + to_string(a_optimal) + " < " + to_string(params.amount_a_min));
            }
            amount_a = a_optimal;
        }
    }

    bool a_is_low = params.asset_a == key.low;
    Amount amount_low = a_is_low ? amount_a : amount_b;
    Amount amount_high = a_is_low ? amount_b : amount_a;

    require_reserve_fits(staged.reserve_low, amount_low);
    require_reserve_fits(staged.reserve_high, amount_high);

    Amount minted = 0;
    Amount locked = 0;
    if (staged.total_shares == 0) {
        minted = pricing::initial_shares(amount_low, amount_high);
        locked = MINIMUM_LIQUIDITY;
    } else {
        minted = pricing::proportional_shares(amount_low, amount_high, staged.reserve_low,
                                              staged.reserve_high, staged.total_shares);
    }

    staged.reserve_low += amount_low;
    staged.reserve_high += amount_high;
    staged.total_shares += minted + locked;

    if (locked != 0) {
        stage_position(key, NULL_ADDRESS).share_amount += locked;
        refresh_ratio(key, NULL_ADDRESS);
    }
    stage_position(key, params.depositor).share_amount += minted;
    refresh_ratio(key, params.depositor);

    stage_pull(params.asset_a, params.depositor, amount_a);
    stage_pull(params.asset_b, params.depositor, amount_b);

    events_.emplace_back(LiquidityAdded{key, params.depositor, amount_low, amount_high, minted});
    return AddLiquidityResult{key, amount_a, amount_b, minted};
}

RemoveLiquidityResult LedgerTxn::remove_liquidity(const RemoveLiquidityParams& params) {
    PairKey key = PairKey::canonical(params.asset_a, params.asset_b);
    if (is_null(params.depositor)) {
        throw SwapError(ErrorCode::InvalidAddress, "depositor must not be null");
    }
    if (params.shares == 0) {
        throw SwapError(ErrorCode::InvalidAmount, "shares must be positive");
    }

    Pool& staged = stage_pool(key);
    DepositorPosition held = position(key, params.depositor);
    if (held.share_amount < params.shares) {
        throw SwapError(ErrorCode::InsufficientShares,
                        to_string(held.share_amount) + " < " + to_string(params.shares));
    }

    // Always live shares against live reserves; share_ratio is never consulted
    auto [amount_low, amount_high] = pricing::burn_amounts(
        params.shares, staged.reserve_low, staged.reserve_high, staged.total_shares);

    bool a_is_low = params.asset_a == key.low;
    Amount amount_a = a_is_low ? amount_low : amount_high;
    Amount amount_b = a_is_low ? amount_high : amount_low;
    if (amount_a == 0 || amount_b == 0) {
        throw SwapError(ErrorCode::InsufficientAmount, "shares redeem to nothing");
    }
    if (amount_a < params.amount_a_min) {
        throw SwapError(ErrorCode::InsufficientAmount,
                        "A: " + to_string(amount_a) + " < " + to_string(params.amount_a_min));
    }
    if (amount_b < params.amount_b_min) {
        throw SwapError(ErrorCode::InsufficientAmount,
                        "B: " + to_string(amount_b) + " < " + to_string(params.amount_b_min));
    }

    staged.reserve_low -= amount_low;
    staged.reserve_high -= amount_high;
    staged.total_shares -= params.shares;

    stage_position(key, params.depositor).share_amount -= params.shares;
    refresh_ratio(key, params.depositor);

    stage_push(params.asset_a, params.depositor, amount_a);
    stage_push(params.asset_b, params.depositor, amount_b);

    events_.emplace_back(LiquidityRemoved{key, params.depositor, amount_low, amount_high, params.shares});
    return RemoveLiquidityResult{key, amount_a, amount_b};
}

// =============================================================================
// LedgerTxn - Swap Hop
// =============================================================================

Amount LedgerTxn::swap_hop(const Asset& asset_in, const Asset& asset_out, Amount amount_in,
                           const Address& sender, const Address& recipient) {
    PairKey key = PairKey::canonical(asset_in, asset_out);
    Pool& staged = stage_pool(key);

    auto [reserve_in, reserve_out] = staged.reserves_for(key, asset_in);
    Amount amount_out = pricing::compute_swap_output(amount_in, reserve_in, reserve_out, fee_rate());
    if (amount_out == 0) {
        throw SwapError(ErrorCode::InsufficientOutputAmount,
                        "hop " + asset_in.to_hex() + " -> " + asset_out.to_hex() + " yields nothing");
    }
    require_reserve_fits(reserve_in, amount_in);

    if (asset_in == key.low) {
        staged.reserve_low += amount_in;
        staged.reserve_high -= amount_out;
    } else {
        staged.reserve_high += amount_in;
        staged.reserve_low -= amount_out;
    }

    events_.emplace_back(SwapExecuted{sender, recipient, asset_in, asset_out, amount_in, amount_out});
    return amount_out;
}

// =============================================================================
// LedgerTxn - Fee Rate / Transfers
// =============================================================================

void LedgerTxn::set_fee_rate(uint32_t new_rate) {
    if (new_rate > MAX_FEE_RATE_BPS) {
        throw SwapError(ErrorCode::FeeTooHigh,
                        std::to_string(new_rate) + " > " + std::to_string(MAX_FEE_RATE_BPS));
    }
    uint32_t old_rate = fee_rate();
    fee_rate_ = new_rate;
    events_.emplace_back(FeeUpdated{old_rate, new_rate});
}

void LedgerTxn::stage_pull(const Asset& asset, const Address& from, Amount amount) {
    transfers_.push_back(StagedTransfer{StagedTransfer::Kind::Pull, asset, from, amount});
}

void LedgerTxn::stage_push(const Asset& asset, const Address& to, Amount amount) {
    transfers_.push_back(StagedTransfer{StagedTransfer::Kind::Push, asset, to, amount});
}

} // namespace zswap
