#ifndef ZSWAP_LEDGER_HPP
#define ZSWAP_LEDGER_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "events.hpp"

namespace zswap {

class LedgerTxn;

// =============================================================================
// Operation Parameters / Results
// =============================================================================

// Amounts are given in the caller's (asset_a, asset_b) order
struct AddLiquidityParams {
    Asset asset_a;
    Asset asset_b;
    Amount amount_a_desired;
    Amount amount_b_desired;
    Amount amount_a_min;
    Amount amount_b_min;
    Address depositor;
};

struct AddLiquidityResult {
    PairKey pair;
    Amount amount_a;
    Amount amount_b;
    Amount shares;
};

struct RemoveLiquidityParams {
    Asset asset_a;
    Asset asset_b;
    Amount shares;
    Amount amount_a_min;
    Amount amount_b_min;
    Address depositor;
};

struct RemoveLiquidityResult {
    PairKey pair;
    Amount amount_a;
    Amount amount_b;
};

// A transfer the operation needs the collaborator to perform at commit
struct StagedTransfer {
    enum class Kind : uint8_t { Pull = 0, Push = 1 };

    Kind kind;
    Asset asset;
    Address holder;
    Amount amount;
};

// =============================================================================
// PairLedger - committed pools, depositor positions and the global fee rate
// =============================================================================

class PairLedger {
public:
    explicit PairLedger(uint32_t fee_rate = DEFAULT_FEE_RATE_BPS);
    ~PairLedger() = default;

    // Non-copyable
    PairLedger(const PairLedger&) = delete;
    PairLedger& operator=(const PairLedger&) = delete;

    // Snapshot queries (shared lock)
    std::optional<Pool> get_pool(const PairKey& key) const;
    std::optional<DepositorPosition> get_position(const PairKey& key,
                                                  const Address& depositor) const;
    uint32_t fee_rate() const;

    // Pair keys in creation order
    std::vector<PairKey> pairs() const;
    size_t pair_count() const;

    // Applies every staged change of `txn` in one step
    void apply(const LedgerTxn& txn);

private:
    std::unordered_map<PairKey, Pool, PairKeyHash> pools_;
    std::vector<PairKey> pair_order_;
    std::unordered_map<PositionKey, DepositorPosition, PositionKeyHash> positions_;
    uint32_t fee_rate_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// LedgerTxn - staged deltas of one operation
//
// Reads fall through to the committed ledger; writes land in local scratch
// maps. Nothing reaches the ledger until PairLedger::apply(). A txn that
// is dropped after a failure leaves the ledger untouched.
// =============================================================================

class LedgerTxn {
public:
    explicit LedgerTxn(const PairLedger& base);

    // Non-copyable
    LedgerTxn(const LedgerTxn&) = delete;
    LedgerTxn& operator=(const LedgerTxn&) = delete;

    // =========================================================================
    // Reads (staged state first, then committed state)
    // =========================================================================

    std::optional<Pool> pool(const PairKey& key) const;
    DepositorPosition position(const PairKey& key, const Address& depositor) const;
    uint32_t fee_rate() const;

    // =========================================================================
    // Staged Operations
    // =========================================================================

    PairKey create_pair(const Asset& asset_a, const Asset& asset_b);

    AddLiquidityResult add_liquidity(const AddLiquidityParams& params);

    RemoveLiquidityResult remove_liquidity(const RemoveLiquidityParams& params);

    // Prices one hop at the staged fee rate and moves the pool's reserves.
    // Returns the hop output.
    Amount swap_hop(const Asset& asset_in, const Asset& asset_out, Amount amount_in,
                    const Address& sender, const Address& recipient);

    // Throws FeeTooHigh above MAX_FEE_RATE_BPS. Authorization is the caller's job.
    void set_fee_rate(uint32_t new_rate);

    void stage_pull(const Asset& asset, const Address& from, Amount amount);
    void stage_push(const Asset& asset, const Address& to, Amount amount);

    // =========================================================================
    // Commit Inputs
    // =========================================================================

    const std::vector<StagedTransfer>& transfers() const { return transfers_; }
    const std::vector<EventPayload>& events() const { return events_; }
    std::vector<EventPayload> take_events() { return std::move(events_); }

private:
    friend class PairLedger;

    const PairLedger& base_;

    std::unordered_map<PairKey, Pool, PairKeyHash> pools_;
    std::vector<PairKey> created_;
    std::unordered_map<PositionKey, DepositorPosition, PositionKeyHash> positions_;
    std::optional<uint32_t> fee_rate_;

    std::vector<StagedTransfer> transfers_;
    std::vector<EventPayload> events_;

    // Staged copy of an existing pool; throws PairDoesNotExist
    Pool& stage_pool(const PairKey& key);
    DepositorPosition& stage_position(const PairKey& key, const Address& depositor);

    // Recompute share_ratio of (key, depositor) against the staged total
    void refresh_ratio(const PairKey& key, const Address& depositor);
};

} // namespace zswap

#endif // ZSWAP_LEDGER_HPP
