#pragma once

#include <cstdint>

#include "unitledger/api/request.hpp"
#include "unitledger/auth/authenticator.hpp"
#include "unitledger/ledger/ledger_core.hpp"
#include "unitledger/ledger/ownership_control.hpp"

namespace unitledger {
namespace api {

enum class Outcome : std::uint8_t {
  kDispatched,
  kRejectedMalformed,
  kRejectedAuth,
};

struct Response {
  Outcome outcome{Outcome::kDispatched};
  ledger::Status status{ledger::Status::kOk};
  std::uint16_t reject_code{0};
  // Received units for sponsor, remaining balance for consume, total forfeited for forfeit.
  common::Units value{0};
};

// Authenticates signed requests and dispatches them with the signer as caller.
class RequestRouter {
 public:
  struct Stats {
    std::uint64_t dispatched{0};
    std::uint64_t rejected_malformed{0};
    std::uint64_t rejected_auth{0};
  };

  RequestRouter(ledger::LedgerCore& ledger, ledger::OwnershipControl& ownership, auth::Authenticator& authenticator);

  Response handle(const SignedRequest& request);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  ledger::LedgerCore& ledger_;
  ledger::OwnershipControl& ownership_;
  auth::Authenticator& authenticator_;
  Stats stats_{};

  Response dispatch(const common::Address& caller, const Request& request);
};

}  // namespace api
}  // namespace unitledger
