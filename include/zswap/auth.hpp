#ifndef ZSWAP_AUTH_HPP
#define ZSWAP_AUTH_HPP

#include <cstdint>
#include <shared_mutex>

#include "types.hpp"

namespace zswap {

enum class Role : uint8_t {
    FeeSetter = 0
};

const char* to_string(Role role);

// =============================================================================
// Authorization Collaborator
// =============================================================================

class IAuthorization {
public:
    virtual ~IAuthorization() = default;

    // Throws SwapError(Unauthorized) unless `caller` holds `role`
    virtual void require_role(const Address& caller, Role role) const = 0;
};

// One principal holds every role
class SingleOwnerAuthorization : public IAuthorization {
public:
    explicit SingleOwnerAuthorization(const Address& owner);

    void require_role(const Address& caller, Role role) const override;

    Address owner() const;

    // Only the current owner may hand over; the new owner must be non-null
    void transfer_ownership(const Address& caller, const Address& new_owner);

private:
    Address owner_;
    mutable std::shared_mutex mutex_;
};

} // namespace zswap

#endif // ZSWAP_AUTH_HPP
