#ifndef ZSWAP_TRANSFER_HPP
#define ZSWAP_TRANSFER_HPP

#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "types.hpp"

namespace zswap {

// =============================================================================
// Asset Transfer Collaborator
//
// Moves value into and out of the venue's custody. Each call is atomic:
// it either moves the full amount or throws SwapError(TransferFailed)
// having moved nothing.
// =============================================================================

class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    // External holder -> custody
    virtual void pull(const Asset& asset, const Address& from, Amount amount) = 0;

    // Custody -> external holder
    virtual void push(const Asset& asset, const Address& to, Amount amount) = 0;
};

// =============================================================================
// InMemoryAssetTransfer - balance book for tests and local simulation
// =============================================================================

class InMemoryAssetTransfer : public IAssetTransfer {
public:
    enum class Direction : uint8_t { Pull = 0, Push = 1 };

    // Observed before each transfer is applied
    using TransferHook = std::function<void(Direction, const Asset&, const Address&, Amount)>;

    InMemoryAssetTransfer() = default;

    // Non-copyable
    InMemoryAssetTransfer(const InMemoryAssetTransfer&) = delete;
    InMemoryAssetTransfer& operator=(const InMemoryAssetTransfer&) = delete;

    void pull(const Asset& asset, const Address& from, Amount amount) override;
    void push(const Asset& asset, const Address& to, Amount amount) override;

    // Credit an external holder out of thin air
    void mint(const Asset& asset, const Address& holder, Amount amount);

    Amount balance_of(const Asset& asset, const Address& holder) const;
    Amount custody_balance(const Asset& asset) const;

    // Blocked holders can neither send nor receive
    void set_blocked(const Address& holder, bool blocked);

    void set_transfer_hook(TransferHook hook);

    uint64_t transfer_count() const;

private:
    struct HolderKey {
        Asset asset;
        Address holder;

        bool operator==(const HolderKey& other) const {
            return asset == other.asset && holder == other.holder;
        }
    };

    struct HolderKeyHash {
        size_t operator()(const HolderKey& key) const {
            uint64_t h = 0;
            for (auto b : key.asset.addr) h = h * 31 + b;
            for (auto b : key.holder) h = h * 31 + b;
            return static_cast<size_t>(h);
        }
    };

    struct AssetHash {
        size_t operator()(const Asset& asset) const {
            uint64_t h = 0;
            for (auto b : asset.addr) h = h * 31 + b;
            return static_cast<size_t>(h);
        }
    };

    struct AddressHash {
        size_t operator()(const Address& addr) const {
            uint64_t h = 0;
            for (auto b : addr) h = h * 31 + b;
            return static_cast<size_t>(h);
        }
    };

    std::unordered_map<HolderKey, Amount, HolderKeyHash> balances_;
    std::unordered_map<Asset, Amount, AssetHash> custody_;
    std::unordered_set<Address, AddressHash> blocked_;
    uint64_t transfer_count_{0};
    mutable std::shared_mutex mutex_;

    TransferHook hook_;
};

} // namespace zswap

#endif // ZSWAP_TRANSFER_HPP
