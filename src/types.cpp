// =============================================================================
// types.cpp - Address, amount and pair-key helpers
// =============================================================================

#include "zswap/types.hpp"
#include "zswap/errors.hpp"

#include <algorithm>

namespace zswap {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr U128 U128_MAX = ~U128(0);

} // anonymous namespace

// =============================================================================
// Address Encoding
// =============================================================================

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// 128-bit Decimal Conversion
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

// =============================================================================
// Canonical Pair Key
// =============================================================================

PairKey PairKey::canonical(const Asset& a, const Asset& b) {
    if (a == b) {
        throw SwapError(ErrorCode::IdenticalAssets, a.to_hex());
    }
    PairKey key = sorted(a, b);
    if (key.low.is_null()) {
        throw SwapError(ErrorCode::NullAsset);
    }
    return key;
}

} // namespace zswap
