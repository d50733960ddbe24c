// =============================================================================
// auth.cpp - Single-owner authorization
// =============================================================================

#include "zswap/auth.hpp"
#include "zswap/errors.hpp"

#include <mutex>

namespace zswap {

const char* to_string(Role role) {
    switch (role) {
        case Role::FeeSetter: return "FEE_SETTER";
    }
    return "UNKNOWN";
}

SingleOwnerAuthorization::SingleOwnerAuthorization(const Address& owner) : owner_(owner) {
    if (is_null(owner)) {
        throw SwapError(ErrorCode::InvalidAddress, "owner must not be null");
    }
}

void SingleOwnerAuthorization::require_role(const Address& caller, Role role) const {
    std::shared_lock lock(mutex_);
    if (caller != owner_) {
        throw SwapError(ErrorCode::Unauthorized,
                        to_hex(caller) + " lacks " + to_string(role));
    }
}

Address SingleOwnerAuthorization::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

void SingleOwnerAuthorization::transfer_ownership(const Address& caller, const Address& new_owner) {
    std::unique_lock lock(mutex_);
    if (caller != owner_) {
        throw SwapError(ErrorCode::Unauthorized, to_hex(caller) + " is not the owner");
    }
    if (is_null(new_owner)) {
        throw SwapError(ErrorCode::InvalidAddress, "owner must not be null");
    }
    owner_ = new_owner;
}

} // namespace zswap
