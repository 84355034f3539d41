#include "unitledger/ledger/ownership_control.hpp"

#include <stdexcept>

namespace unitledger {
namespace ledger {

OwnershipControl::OwnershipControl(common::Address owner, audit::EventSink& events)
    : owner_(owner), events_(events) {
  if (owner_.is_null()) {
    throw std::invalid_argument("owner cannot be the null address");
  }
}

bool OwnershipControl::transfer_ownership(const common::Address& caller, const common::Address& new_owner) {
  if (!is_owner(caller)) {
    return false;
  }
  if (new_owner.is_null()) {
    pending_owner_.reset();
  } else {
    pending_owner_ = new_owner;
  }
  events_.publish(audit::OwnershipTransferStarted{.owner = owner_, .pending_owner = new_owner});
  return true;
}

bool OwnershipControl::accept_ownership(const common::Address& caller) {
  if (!pending_owner_ || *pending_owner_ != caller) {
    return false;
  }
  const common::Address previous = owner_;
  owner_ = caller;
  pending_owner_.reset();
  events_.publish(audit::OwnershipTransferred{.previous_owner = previous, .new_owner = owner_});
  return true;
}

void OwnershipControl::restore(const common::Address& owner, std::optional<common::Address> pending_owner) {
  if (owner.is_null()) {
    throw std::invalid_argument("owner cannot be the null address");
  }
  if (pending_owner && pending_owner->is_null()) {
    pending_owner.reset();
  }
  owner_ = owner;
  pending_owner_ = pending_owner;
}

}  // namespace ledger
}  // namespace unitledger
