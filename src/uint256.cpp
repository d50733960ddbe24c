// =============================================================================
// uint256.cpp - 256-bit intermediates for reserve arithmetic
// =============================================================================

#include "zswap/uint256.hpp"
#include "zswap/errors.hpp"

#include <stdexcept>

namespace zswap {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

int bit_length_u128(U128 v) {
    int n = 0;
    while (v != 0) { v >>= 1; n++; }
    return n;
}

bool test_bit(const U256& v, int i) {
    return i >= 128 ? ((v.hi >> (i - 128)) & 1) != 0 : ((v.lo >> i) & 1) != 0;
}

void set_bit(U256& v, int i) {
    if (i >= 128) {
        v.hi |= U128(1) << (i - 128);
    } else {
        v.lo |= U128(1) << i;
    }
}

// Wrapping subtraction (mod 2^256)
U256 wrapping_sub(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo - b.lo;
    r.hi = a.hi - b.hi - (a.lo < b.lo ? 1 : 0);
    return r;
}

} // anonymous namespace

int U256::bit_length() const {
    return hi != 0 ? 128 + bit_length_u128(hi) : bit_length_u128(lo);
}

namespace math {

// =============================================================================
// Multiplication
// =============================================================================

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate the middle column with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

std::optional<U256> checked_mul(const U256& a, U128 b) {
    U256 low = mul_wide(a.lo, b);
    U256 high = mul_wide(a.hi, b);
    if (high.hi != 0) return std::nullopt;

    U256 result;
    result.lo = low.lo;
    result.hi = low.hi + high.lo;
    if (result.hi < low.hi) return std::nullopt;  // carry out of bit 255
    return result;
}

std::optional<U256> checked_add(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    U128 carry = r.lo < a.lo ? 1 : 0;
    r.hi = a.hi + b.hi;
    if (r.hi < a.hi) return std::nullopt;
    U128 hi_with_carry = r.hi + carry;
    if (hi_with_carry < r.hi) return std::nullopt;
    r.hi = hi_with_carry;
    return r;
}

U256 sub(const U256& a, const U256& b) {
    if (a < b) {
        throw std::domain_error("U256 subtraction underflow");
    }
    return wrapping_sub(a, b);
}

// =============================================================================
// Division (binary long division)
// =============================================================================

DivResult divmod(const U256& num, const U256& denom) {
    if (denom.is_zero()) {
        throw std::domain_error("U256 division by zero");
    }
    if (num < denom) {
        return {U256(0), num};
    }
    if (num.fits_u128() && denom.fits_u128()) {
        return {U256(num.lo / denom.lo), U256(num.lo % denom.lo)};
    }

    U256 quot;
    U256 rem;
    for (int i = num.bit_length() - 1; i >= 0; --i) {
        // rem = (rem << 1) | bit i of num, remembering the bit shifted out
        bool carry = (rem.hi >> 127) != 0;
        rem.hi = (rem.hi << 1) | (rem.lo >> 127);
        rem.lo = (rem.lo << 1) | (test_bit(num, i) ? 1 : 0);

        if (carry || rem >= denom) {
            rem = wrapping_sub(rem, denom);
            set_bit(quot, i);
        }
    }
    return {quot, rem};
}

U128 div_narrow(const U256& num, const U256& denom) {
    DivResult r = divmod(num, denom);
    if (!r.quotient.fits_u128()) {
        throw SwapError(ErrorCode::Overflow, "quotient exceeds 128 bits");
    }
    return r.quotient.lo;
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    return div_narrow(mul_wide(a, b), U256(denom));
}

U128 mul_div_up(U128 a, U128 b, U128 denom) {
    DivResult r = divmod(mul_wide(a, b), U256(denom));
    if (!r.quotient.fits_u128()) {
        throw SwapError(ErrorCode::Overflow, "quotient exceeds 128 bits");
    }
    U128 result = r.quotient.lo;
    if (!r.remainder.is_zero()) {
        if (result == ~U128(0)) {
            throw SwapError(ErrorCode::Overflow, "quotient exceeds 128 bits");
        }
        result += 1;
    }
    return result;
}

// =============================================================================
// Square Root (bit-by-bit, exact floor)
// =============================================================================

U128 isqrt(const U256& x) {
    if (x.is_zero()) return 0;
    U128 root = 0;
    for (int bit = 127; bit >= 0; --bit) {
        U128 candidate = root | (U128(1) << bit);
        if (mul_wide(candidate, candidate) <= x) {
            root = candidate;
        }
    }
    return root;
}

} // namespace math

} // namespace zswap
