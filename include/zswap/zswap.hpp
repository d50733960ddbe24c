#ifndef ZSWAP_ZSWAP_HPP
#define ZSWAP_ZSWAP_HPP

// =============================================================================
// ZSwap - constant-product AMM venue
//
//   PairLedger   pools, depositor positions, global fee rate
//   LedgerTxn    staged deltas of one operation
//   pricing::    quote / swap output / swap input / share math
//   EventLog     append-only notifications
//
// Value moves through an injected IAssetTransfer; fee governance is gated
// by an injected IAuthorization.
// =============================================================================

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "types.hpp"
#include "errors.hpp"
#include "pricing.hpp"
#include "events.hpp"
#include "ledger.hpp"
#include "transfer.hpp"
#include "auth.hpp"

namespace zswap {

struct SwapResult {
    std::vector<Amount> amounts;   // amounts[0] = input, amounts[i + 1] = output of hop i

    Amount amount_out() const { return amounts.empty() ? 0 : amounts.back(); }
};

class ZSwap {
public:
    ZSwap(IAssetTransfer& transfer, const IAuthorization& auth,
          uint32_t initial_fee_rate = DEFAULT_FEE_RATE_BPS);
    ~ZSwap() = default;

    // Non-copyable
    ZSwap(const ZSwap&) = delete;
    ZSwap& operator=(const ZSwap&) = delete;

    // =========================================================================
    // Mutating Operations (one at a time; all-or-nothing)
    // =========================================================================

    PairKey create_pair(const Asset& asset_a, const Asset& asset_b);

    AddLiquidityResult add_liquidity(const AddLiquidityParams& params);

    RemoveLiquidityResult remove_liquidity(const RemoveLiquidityParams& params);

    // Exact-input swap along `path` (>= 2 distinct assets). Pulls amount_in of
    // path[0] from `caller`, pushes the final output to `recipient`.
    SwapResult swap(const Address& caller, Amount amount_in, Amount amount_out_min,
                    const std::vector<Asset>& path, const Address& recipient);

    // Requires Role::FeeSetter
    void set_fee_rate(const Address& caller, uint32_t new_rate);

    // =========================================================================
    // Pricing (current fee rate)
    // =========================================================================

    static Amount quote(Amount amount_in, Amount reserve_in, Amount reserve_out) {
        return pricing::quote(amount_in, reserve_in, reserve_out);
    }

    Amount compute_swap_output(Amount amount_in, Amount reserve_in, Amount reserve_out) const {
        return pricing::compute_swap_output(amount_in, reserve_in, reserve_out, fee_rate());
    }

    Amount compute_swap_input(Amount amount_out, Amount reserve_in, Amount reserve_out) const {
        return pricing::compute_swap_input(amount_out, reserve_in, reserve_out, fee_rate());
    }

    // Hop-by-hop outputs for an exact input, without executing
    std::vector<Amount> get_amounts_out(Amount amount_in, const std::vector<Asset>& path) const;

    // Hop-by-hop inputs required for an exact final output, without executing
    std::vector<Amount> get_amounts_in(Amount amount_out, const std::vector<Asset>& path) const;

    // =========================================================================
    // Queries (committed snapshot, no write lock)
    // =========================================================================

    std::optional<Pool> get_pool(const Asset& asset_a, const Asset& asset_b) const;
    std::optional<DepositorPosition> get_depositor_position(const Asset& asset_a,
                                                            const Asset& asset_b,
                                                            const Address& depositor) const;
    uint32_t fee_rate() const { return ledger_.fee_rate(); }
    std::vector<PairKey> pairs() const { return ledger_.pairs(); }

    const PairLedger& ledger() const { return ledger_; }
    EventLog& events() { return events_; }
    const EventLog& events() const { return events_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pairs;
        uint64_t total_swaps;
        uint64_t total_hops;
        uint64_t total_liquidity_ops;
        uint64_t aborted_operations;
    };
    Stats get_stats() const;

private:
    IAssetTransfer& transfer_;
    const IAuthorization& auth_;

    PairLedger ledger_;
    EventLog events_;

    // Single-writer boundary
    std::mutex write_mutex_;
    std::atomic<std::thread::id> writer_{};

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_hops_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    std::atomic<uint64_t> aborted_operations_{0};

    // Holds the write mutex for one operation; rejects re-entry from the
    // thread that already holds it
    class OperationGuard {
    public:
        OperationGuard(ZSwap& owner, const char* operation);
        ~OperationGuard();

        OperationGuard(const OperationGuard&) = delete;
        OperationGuard& operator=(const OperationGuard&) = delete;

    private:
        ZSwap& owner_;
        std::unique_lock<std::mutex> lock_;
    };

    using StageFn = std::function<void(LedgerTxn&)>;

    // Stage -> transfer -> apply -> publish, under the operation guard
    void execute(const char* operation, const StageFn& stage);

    // Runs staged transfers (pulls first); reverses completed ones on failure
    void settle(const std::vector<StagedTransfer>& transfers);
    void reverse(const std::vector<StagedTransfer>& completed);

    static void validate_path(const std::vector<Asset>& path);
};

} // namespace zswap

#endif // ZSWAP_ZSWAP_HPP
