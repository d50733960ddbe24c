// =============================================================================
// errors.cpp - Error taxonomy
// =============================================================================

#include "zswap/errors.hpp"

namespace zswap {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IdenticalAssets:             return "IDENTICAL_ASSETS";
        case ErrorCode::NullAsset:                   return "NULL_ASSET";
        case ErrorCode::InvalidAmount:               return "INVALID_AMOUNT";
        case ErrorCode::InvalidPath:                 return "INVALID_PATH";
        case ErrorCode::InvalidAddress:              return "INVALID_ADDRESS";
        case ErrorCode::InvalidFee:                  return "INVALID_FEE";
        case ErrorCode::PairExists:                  return "PAIR_EXISTS";
        case ErrorCode::PairDoesNotExist:            return "PAIR_DOES_NOT_EXIST";
        case ErrorCode::InsufficientLiquidity:       return "INSUFFICIENT_LIQUIDITY";
        case ErrorCode::InsufficientLiquidityMinted: return "INSUFFICIENT_LIQUIDITY_MINTED";
        case ErrorCode::InsufficientAmount:          return "INSUFFICIENT_AMOUNT";
        case ErrorCode::ExcessiveInput:              return "EXCESSIVE_INPUT";
        case ErrorCode::InsufficientShares:          return "INSUFFICIENT_SHARES";
        case ErrorCode::InsufficientOutputAmount:    return "INSUFFICIENT_OUTPUT_AMOUNT";
        case ErrorCode::ReserveOverflow:             return "RESERVE_OVERFLOW";
        case ErrorCode::Overflow:                    return "OVERFLOW";
        case ErrorCode::Unauthorized:                return "UNAUTHORIZED";
        case ErrorCode::FeeTooHigh:                  return "FEE_TOO_HIGH";
        case ErrorCode::TransferFailed:              return "TRANSFER_FAILED";
        case ErrorCode::ReentrantCall:               return "REENTRANT_CALL";
    }
    return "UNKNOWN";
}

SwapError::SwapError(ErrorCode code)
    : std::runtime_error(std::string("ZSwap: ") + to_string(code)), code_(code) {}

SwapError::SwapError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string("ZSwap: ") + to_string(code) + " (" + detail + ")"),
      code_(code) {}

} // namespace zswap
