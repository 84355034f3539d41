#include "unitledger/api/request_router.hpp"

#include <stdexcept>

namespace unitledger {
namespace api {

namespace {

template <typename Result>
Response from_result(const Result& result, common::Units value) {
  return Response{.outcome = Outcome::kDispatched,
                  .status = result.status,
                  .reject_code = result.reject_code,
                  .value = value};
}

Response from_flag(bool accepted) {
  const auto status = accepted ? ledger::Status::kOk : ledger::Status::kUnauthorizedCaller;
  return Response{.outcome = Outcome::kDispatched, .status = status, .reject_code = ledger::reject_code(status)};
}

}  // namespace

RequestRouter::RequestRouter(ledger::LedgerCore& ledger,
                             ledger::OwnershipControl& ownership,
                             auth::Authenticator& authenticator)
    : ledger_(ledger), ownership_(ownership), authenticator_(authenticator) {}

Response RequestRouter::handle(const SignedRequest& signed_request) {
  Request request;
  try {
    request = decode_request(signed_request.body);
  } catch (const std::runtime_error&) {
    ++stats_.rejected_malformed;
    return Response{.outcome = Outcome::kRejectedMalformed};
  }

  const auto caller = authenticator_.authenticate(signed_request.public_key, request.nonce,
                                                  signed_request.body, signed_request.signature);
  if (!caller) {
    ++stats_.rejected_auth;
    return Response{.outcome = Outcome::kRejectedAuth};
  }

  ++stats_.dispatched;
  return dispatch(*caller, request);
}

Response RequestRouter::dispatch(const common::Address& caller, const Request& request) {
  switch (request.kind) {
    case RequestKind::kSponsor: {
      const auto result = ledger_.sponsor(caller, request.beneficiary, request.asset, request.amount);
      return from_result(result, result.received);
    }
    case RequestKind::kConsume: {
      const auto result = ledger_.consume(caller, request.beneficiary, request.asset, request.amount);
      return from_result(result, result.remaining);
    }
    case RequestKind::kClearIfEmpty:
      return from_result(ledger_.clear_sponsor_if_empty(caller), 0);
    case RequestKind::kClearAndForfeit: {
      const auto result = ledger_.clear_sponsor_and_forfeit(caller, request.assets);
      return from_result(result, result.total_forfeited);
    }
    case RequestKind::kSetEngine:
      return from_result(ledger_.set_consuming_engine(caller, request.target), 0);
    case RequestKind::kTransferOwnership:
      return from_flag(ownership_.transfer_ownership(caller, request.target));
    case RequestKind::kAcceptOwnership:
      return from_flag(ownership_.accept_ownership(caller));
  }
  return Response{.outcome = Outcome::kRejectedMalformed};
}

}  // namespace api
}  // namespace unitledger
