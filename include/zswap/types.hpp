#ifndef ZSWAP_TYPES_HPP
#define ZSWAP_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <utility>

namespace zswap {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// address(0): the null identifier
constexpr Address NULL_ADDRESS = {};

constexpr bool is_null(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Build an address whose trailing bytes hold `n` (big-endian).
// Handy for tests and scenario files: from_uint(0x10) == 0x00..0010
constexpr Address from_uint(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional 0x prefix and exactly 40 hex digits
std::optional<Address> from_hex(std::string_view hex);

// =============================================================================
// Integer Amounts
// =============================================================================

// All amounts are non-negative integers in the asset's smallest unit
using U128 = unsigned __int128;
using Amount = U128;

std::string to_string(U128 value);
std::optional<U128> parse_u128(std::string_view text);

// =============================================================================
// Asset (fungible asset identifier)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool is_null() const { return zswap::is_null(addr); }

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }

    std::string to_hex() const { return zswap::to_hex(addr); }
};

inline const Asset NULL_ASSET{};

// =============================================================================
// Pair Key (canonical asset pair)
// =============================================================================

struct PairKey {
    Asset low;   // Sorted: low < high
    Asset high;

    // Orders the two assets; does not validate them
    static PairKey sorted(const Asset& a, const Asset& b) {
        return a < b ? PairKey{a, b} : PairKey{b, a};
    }

    // Canonical key for (a, b); throws IdenticalAssets / NullAsset
    static PairKey canonical(const Asset& a, const Asset& b);

    bool contains(const Asset& asset) const { return asset == low || asset == high; }

    bool operator==(const PairKey& other) const {
        return low == other.low && high == other.high;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }

    uint64_t hash() const {
        uint64_t h = 0;
        for (auto b : low.addr) h = h * 31 + b;
        for (auto b : high.addr) h = h * 31 + b;
        return h;
    }
};

// =============================================================================
// Position Key (pair + depositor)
// =============================================================================

struct PositionKey {
    PairKey pair;
    Address depositor;

    bool operator==(const PositionKey& other) const {
        return pair == other.pair && depositor == other.depositor;
    }

    uint64_t hash() const {
        uint64_t h = pair.hash();
        for (auto b : depositor) h = h * 31 + b;
        return h;
    }
};

struct PairKeyHash {
    size_t operator()(const PairKey& key) const { return static_cast<size_t>(key.hash()); }
};

struct PositionKeyHash {
    size_t operator()(const PositionKey& key) const { return static_cast<size_t>(key.hash()); }
};

// =============================================================================
// Ledger Records
// =============================================================================

struct Pool {
    bool exists = false;
    Amount reserve_low = 0;
    Amount reserve_high = 0;
    Amount total_shares = 0;

    // (reserve of `asset`, reserve of the other side)
    std::pair<Amount, Amount> reserves_for(const PairKey& key, const Asset& asset) const {
        return asset == key.low ? std::make_pair(reserve_low, reserve_high)
                                : std::make_pair(reserve_high, reserve_low);
    }
};

struct DepositorPosition {
    Amount share_amount = 0;
    Amount share_ratio = 0;   // share_amount / total_shares, scaled by SHARE_RATIO_SCALE
};

// =============================================================================
// Protocol Constants
// =============================================================================

// Shares withheld from the first deposit and credited to NULL_ADDRESS
constexpr Amount MINIMUM_LIQUIDITY = 1000;

// Fees in basis points
constexpr uint32_t FEE_DENOMINATOR_BPS = 10000;
constexpr uint32_t DEFAULT_FEE_RATE_BPS = 30;    // 0.30%
constexpr uint32_t MAX_FEE_RATE_BPS = 500;       // 5.00%

// Fixed-point scale for DepositorPosition::share_ratio (1e18 = 100%)
constexpr Amount SHARE_RATIO_SCALE = 1000000000000000000ULL;

// Reserves are capped at 2^112 - 1 so every pricing product fits in 256 bits
constexpr Amount MAX_RESERVE = (Amount(1) << 112) - 1;

} // namespace zswap

#endif // ZSWAP_TYPES_HPP
