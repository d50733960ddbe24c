#ifndef ZSWAP_ERRORS_HPP
#define ZSWAP_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace zswap {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    // Input validation
    IdenticalAssets = -1,
    NullAsset = -2,
    InvalidAmount = -3,
    InvalidPath = -4,
    InvalidAddress = -5,
    InvalidFee = -6,

    // Ledger / liquidity
    PairExists = -10,
    PairDoesNotExist = -11,
    InsufficientLiquidity = -12,
    InsufficientLiquidityMinted = -13,
    InsufficientAmount = -14,
    ExcessiveInput = -15,
    InsufficientShares = -16,
    InsufficientOutputAmount = -17,
    ReserveOverflow = -18,
    Overflow = -19,

    // Administration
    Unauthorized = -20,
    FeeTooHigh = -21,

    // Collaborators
    TransferFailed = -30,

    // Scheduling
    ReentrantCall = -40
};

// Stable reason tag, e.g. "PAIR_EXISTS"
const char* to_string(ErrorCode code);

// =============================================================================
// SwapError - every failed operation surfaces as one of these
// =============================================================================

class SwapError : public std::runtime_error {
public:
    explicit SwapError(ErrorCode code);
    SwapError(ErrorCode code, const std::string& detail);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace zswap

#endif // ZSWAP_ERRORS_HPP
