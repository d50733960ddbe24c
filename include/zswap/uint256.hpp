#ifndef ZSWAP_UINT256_HPP
#define ZSWAP_UINT256_HPP

#include <optional>

#include "types.hpp"

namespace zswap {

// =============================================================================
// 256-bit Unsigned Integer (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }

    // Number of significant bits (0 for zero)
    int bit_length() const;
};

namespace math {

// Full 128x128 -> 256 product (never overflows)
U256 mul_wide(U128 a, U128 b);

// 256x128 product; nullopt if the result needs more than 256 bits
std::optional<U256> checked_mul(const U256& a, U128 b);

// nullopt on carry out of bit 255
std::optional<U256> checked_add(const U256& a, const U256& b);

// Requires a >= b
U256 sub(const U256& a, const U256& b);

// Quotient and remainder; denom must be non-zero
struct DivResult {
    U256 quotient;
    U256 remainder;
};
DivResult divmod(const U256& num, const U256& denom);

// floor(a * b / denom) with a 256-bit intermediate.
// Throws SwapError(Overflow) if the quotient exceeds 128 bits and
// std::domain_error on a zero denominator.
U128 mul_div(U128 a, U128 b, U128 denom);

// Same, rounding up when the division leaves a remainder
U128 mul_div_up(U128 a, U128 b, U128 denom);

// floor(num / denom) for 256-bit operands, narrowed to 128 bits (Overflow otherwise)
U128 div_narrow(const U256& num, const U256& denom);

// floor(sqrt(x))
U128 isqrt(const U256& x);

} // namespace math

} // namespace zswap

#endif // ZSWAP_UINT256_HPP
