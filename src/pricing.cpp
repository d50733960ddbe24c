// =============================================================================
// pricing.cpp - Constant-product pricing (x * y = k)
// =============================================================================

#include "zswap/pricing.hpp"
#include "zswap/uint256.hpp"
#include "zswap/errors.hpp"

#include <algorithm>

namespace zswap {
namespace pricing {

namespace {

void require_fee(uint32_t fee_rate, uint32_t fee_denominator) {
    if (fee_denominator == 0 || fee_rate >= fee_denominator) {
        throw SwapError(ErrorCode::InvalidFee,
                        std::to_string(fee_rate) + "/" + std::to_string(fee_denominator));
    }
}

void require_reserves(Amount reserve_in, Amount reserve_out) {
    if (reserve_in == 0 || reserve_out == 0) {
        throw SwapError(ErrorCode::InsufficientLiquidity);
    }
}

U256 require_fits(const std::optional<U256>& value) {
    if (!value) {
        throw SwapError(ErrorCode::Overflow, "intermediate exceeds 256 bits");
    }
    return *value;
}

} // anonymous namespace

// =============================================================================
// Quotes
// =============================================================================

Amount quote(Amount amount_in, Amount reserve_in, Amount reserve_out) {
    if (amount_in == 0) {
        throw SwapError(ErrorCode::InvalidAmount);
    }
    require_reserves(reserve_in, reserve_out);
    return math::mul_div(amount_in, reserve_out, reserve_in);
}

Amount compute_swap_output(Amount amount_in, Amount reserve_in, Amount reserve_out,
                           uint32_t fee_rate, uint32_t fee_denominator) {
    if (amount_in == 0) {
        throw SwapError(ErrorCode::InvalidAmount);
    }
    require_reserves(reserve_in, reserve_out);
    require_fee(fee_rate, fee_denominator);

    U256 in_after_fee = math::mul_wide(amount_in, fee_denominator - fee_rate);
    U256 numerator = require_fits(math::checked_mul(in_after_fee, reserve_out));
    U256 denominator = require_fits(
        math::checked_add(math::mul_wide(reserve_in, fee_denominator), in_after_fee));

    return math::div_narrow(numerator, denominator);
}

Amount compute_swap_input(Amount amount_out, Amount reserve_in, Amount reserve_out,
                          uint32_t fee_rate, uint32_t fee_denominator) {
    if (amount_out == 0) {
        throw SwapError(ErrorCode::InvalidAmount);
    }
    require_reserves(reserve_in, reserve_out);
    if (amount_out >= reserve_out) {
        throw SwapError(ErrorCode::InsufficientLiquidity, "output exceeds reserve");
    }
    require_fee(fee_rate, fee_denominator);

    U256 numerator = require_fits(
        math::checked_mul(math::mul_wide(reserve_in, amount_out), fee_denominator));
    U256 denominator = math::mul_wide(reserve_out - amount_out, fee_denominator - fee_rate);

    Amount amount_in = math::div_narrow(numerator, denominator);
    if (amount_in == ~Amount(0)) {
        throw SwapError(ErrorCode::Overflow, "input exceeds 128 bits");
    }
    return amount_in + 1;
}

// =============================================================================
// Liquidity Shares
// =============================================================================

Amount initial_shares(Amount amount_low, Amount amount_high) {
    Amount root = math::isqrt(math::mul_wide(amount_low, amount_high));
    if (root <= MINIMUM_LIQUIDITY) {
        throw SwapError(ErrorCode::InsufficientLiquidityMinted,
                        "first deposit root " + to_string(root) + " does not clear the lock");
    }
    return root - MINIMUM_LIQUIDITY;
}

Amount proportional_shares(Amount amount_low, Amount amount_high,
                           Amount reserve_low, Amount reserve_high, Amount total_shares) {
    require_reserves(reserve_low, reserve_high);
    if (total_shares == 0) {
        throw SwapError(ErrorCode::InsufficientLiquidity, "pool has no shares");
    }

    Amount by_low = math::mul_div(amount_low, total_shares, reserve_low);
    Amount by_high = math::mul_div(amount_high, total_shares, reserve_high);
    Amount shares = std::min(by_low, by_high);
    if (shares == 0) {
        throw SwapError(ErrorCode::InsufficientLiquidityMinted);
    }
    return shares;
}

std::pair<Amount, Amount> burn_amounts(Amount shares, Amount reserve_low,
                                       Amount reserve_high, Amount total_shares) {
    if (total_shares == 0) {
        throw SwapError(ErrorCode::InsufficientLiquidity, "pool has no shares");
    }
    if (shares > total_shares) {
        throw SwapError(ErrorCode::InsufficientShares);
    }
    return {math::mul_div(shares, reserve_low, total_shares),
            math::mul_div(shares, reserve_high, total_shares)};
}

Amount share_ratio(Amount share_amount, Amount total_shares) {
    if (share_amount == 0 || total_shares == 0) return 0;
    return math::mul_div(share_amount, SHARE_RATIO_SCALE, total_shares);
}

} // namespace pricing
} // namespace zswap
