// =============================================================================
// transfer.cpp - In-memory asset transfer collaborator
// =============================================================================

#include "zswap/transfer.hpp"
#include "zswap/errors.hpp"

#include <mutex>

namespace zswap {

void InMemoryAssetTransfer::pull(const Asset& asset, const Address& from, Amount amount) {
    TransferHook hook;
    {
        std::shared_lock lock(mutex_);
        hook = hook_;
    }
    if (hook) {
        hook(Direction::Pull, asset, from, amount);
    }

    std::unique_lock lock(mutex_);
    if (blocked_.count(from)) {
        throw SwapError(ErrorCode::TransferFailed, "pull from blocked holder " + to_hex(from));
    }

    auto it = balances_.find(HolderKey{asset, from});
    Amount available = it != balances_.end() ? it->second : 0;
    if (available < amount) {
        throw SwapError(ErrorCode::TransferFailed,
                        "pull of " + to_string(amount) + " " + asset.to_hex() +
                        " exceeds balance " + to_string(available));
    }
    if (amount == 0) return;

    it->second -= amount;
    custody_[asset] += amount;
    transfer_count_++;
}

void InMemoryAssetTransfer::push(const Asset& asset, const Address& to, Amount amount) {
    TransferHook hook;
    {
        std::shared_lock lock(mutex_);
        hook = hook_;
    }
    if (hook) {
        hook(Direction::Push, asset, to, amount);
    }

    std::unique_lock lock(mutex_);
    if (blocked_.count(to)) {
        throw SwapError(ErrorCode::TransferFailed, "push to blocked holder " + to_hex(to));
    }

    Amount& held = custody_[asset];
    if (held < amount) {
        throw SwapError(ErrorCode::TransferFailed,
                        "push of " + to_string(amount) + " " + asset.to_hex() +
                        " exceeds custody " + to_string(held));
    }
    if (amount == 0) return;

    held -= amount;
    balances_[HolderKey{asset, to}] += amount;
    transfer_count_++;
}

void InMemoryAssetTransfer::mint(const Asset& asset, const Address& holder, Amount amount) {
    std::unique_lock lock(mutex_);
    balances_[HolderKey{asset, holder}] += amount;
}

Amount InMemoryAssetTransfer::balance_of(const Asset& asset, const Address& holder) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(HolderKey{asset, holder});
    return it != balances_.end() ? it->second : 0;
}

Amount InMemoryAssetTransfer::custody_balance(const Asset& asset) const {
    std::shared_lock lock(mutex_);
    auto it = custody_.find(asset);
    return it != custody_.end() ? it->second : 0;
}

void InMemoryAssetTransfer::set_blocked(const Address& holder, bool blocked) {
    std::unique_lock lock(mutex_);
    if (blocked) {
        blocked_.insert(holder);
    } else {
        blocked_.erase(holder);
    }
}

void InMemoryAssetTransfer::set_transfer_hook(TransferHook hook) {
    std::unique_lock lock(mutex_);
    hook_ = std::move(hook);
}

uint64_t InMemoryAssetTransfer::transfer_count() const {
    std::shared_lock lock(mutex_);
    return transfer_count_;
}

} // namespace zswap
