#pragma once

#include <optional>

#include "unitledger/audit/event_sink.hpp"
#include "unitledger/common/types.hpp"

namespace unitledger {
namespace ledger {

// Two-step ownership handoff: the owner nominates, the nominee accepts.
class OwnershipControl {
 public:
  OwnershipControl(common::Address owner, audit::EventSink& events);

  // Nominating the null address cancels a pending handoff. Returns false if caller is not the owner.
  bool transfer_ownership(const common::Address& caller, const common::Address& new_owner);
  // Returns false unless caller is the pending owner.
  bool accept_ownership(const common::Address& caller);

  // Reinstates recovered state without publishing a record.
  void restore(const common::Address& owner, std::optional<common::Address> pending_owner);

  [[nodiscard]] bool is_owner(const common::Address& caller) const noexcept { return caller == owner_; }
  [[nodiscard]] const common::Address& owner() const noexcept { return owner_; }
  [[nodiscard]] const std::optional<common::Address>& pending_owner() const noexcept { return pending_owner_; }

 private:
  common::Address owner_;
  std::optional<common::Address> pending_owner_{};
  audit::EventSink& events_;
};

}  // namespace ledger
}  // namespace unitledger
