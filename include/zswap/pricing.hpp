#ifndef ZSWAP_PRICING_HPP
#define ZSWAP_PRICING_HPP

#include <utility>

#include "types.hpp"

namespace zswap {

// =============================================================================
// Pricing Engine
//
// Pure integer functions. Every division truncates toward zero, and where
// truncation could move value it is arranged to favour the pool.
// =============================================================================

namespace pricing {

// floor(amount_in * reserve_out / reserve_in)
// Throws InvalidAmount (amount_in == 0), InsufficientLiquidity (zero reserve)
Amount quote(Amount amount_in, Amount reserve_in, Amount reserve_out);

// Constant-product output for an exact input, fee deducted from the input:
//   after_fee  = amount_in * (fee_denominator - fee_rate)
//   amount_out = after_fee * reserve_out / (reserve_in * fee_denominator + after_fee)
Amount compute_swap_output(Amount amount_in, Amount reserve_in, Amount reserve_out,
                           uint32_t fee_rate, uint32_t fee_denominator = FEE_DENOMINATOR_BPS);

// Minimum input for an exact output, rounded up (+1) so the pool never under-collects:
//   reserve_in * amount_out * D / ((reserve_out - amount_out) * (D - fee_rate)) + 1
// Throws InsufficientLiquidity when amount_out >= reserve_out
Amount compute_swap_input(Amount amount_out, Amount reserve_in, Amount reserve_out,
                          uint32_t fee_rate, uint32_t fee_denominator = FEE_DENOMINATOR_BPS);

// Shares for the first deposit: isqrt(a * b) - MINIMUM_LIQUIDITY.
// Throws InsufficientLiquidityMinted when the root does not clear the lock.
Amount initial_shares(Amount amount_low, Amount amount_high);

// Shares for a later deposit: min(a * T / rL, b * T / rH).
// Throws InsufficientLiquidityMinted if the result is zero.
Amount proportional_shares(Amount amount_low, Amount amount_high,
                           Amount reserve_low, Amount reserve_high, Amount total_shares);

// Withdrawal for `shares`: (floor(s * rL / T), floor(s * rH / T))
std::pair<Amount, Amount> burn_amounts(Amount shares, Amount reserve_low,
                                       Amount reserve_high, Amount total_shares);

// share_amount / total_shares scaled by SHARE_RATIO_SCALE; zero if either is zero
Amount share_ratio(Amount share_amount, Amount total_shares);

} // namespace pricing

} // namespace zswap

#endif // ZSWAP_PRICING_HPP
