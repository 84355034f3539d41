#include "unitledger/ledger/ledger_core.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace unitledger {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeInvalidAddress = 3001;
constexpr std::uint16_t kRejectCodeSelfSponsorship = 3002;
constexpr std::uint16_t kRejectCodeInvalidAmount = 3003;
constexpr std::uint16_t kRejectCodeAssetNotEligible = 3004;
constexpr std::uint16_t kRejectCodeSponsorLocked = 3005;
constexpr std::uint16_t kRejectCodeTransferFailed = 3006;
constexpr std::uint16_t kRejectCodeZeroReceived = 3007;
constexpr std::uint16_t kRejectCodeCapExceeded = 3008;
constexpr std::uint16_t kRejectCodeUnauthorizedCaller = 3009;
constexpr std::uint16_t kRejectCodeInsufficientBalance = 3010;
constexpr std::uint16_t kRejectCodeNothingToForfeit = 3011;
constexpr std::uint16_t kRejectCodeNotEmpty = 3012;
constexpr std::uint16_t kRejectCodeReentrantCall = 3013;

class InFlightGuard {
 public:
  explicit InFlightGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~InFlightGuard() { flag_ = false; }
  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  bool& flag_;
};

// Reverts the measured transfer unless it is committed.
class PendingTransfer {
 public:
  PendingTransfer(sink::TransferMeter& meter, sink::TransferReceipt receipt)
      : meter_(meter), receipt_(receipt) {}
  ~PendingTransfer() {
    if (!settled_) {
      meter_.revert(receipt_);
    }
  }
  PendingTransfer(const PendingTransfer&) = delete;
  PendingTransfer& operator=(const PendingTransfer&) = delete;

  [[nodiscard]] const sink::TransferReceipt& receipt() const noexcept { return receipt_; }

  void commit() {
    meter_.commit(receipt_);
    settled_ = true;
  }

 private:
  sink::TransferMeter& meter_;
  sink::TransferReceipt receipt_;
  bool settled_{false};
};

bool fits(common::Units current, common::Units delta) noexcept {
  return current <= std::numeric_limits<common::Units>::max() - delta;
}

template <typename Result>
Result rejected(Result result, Status status) {
  result.status = status;
  result.reject_code = reject_code(status);
  return result;
}

}  // namespace

std::string_view to_string(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return "ok";
    case Status::kInvalidAddress:
      return "invalid-address";
    case Status::kSelfSponsorship:
      return "self-sponsorship-forbidden";
    case Status::kInvalidAmount:
      return "invalid-amount";
    case Status::kAssetNotEligible:
      return "asset-not-eligible";
    case Status::kSponsorLocked:
      return "sponsor-locked";
    case Status::kTransferFailed:
      return "transfer-failed";
    case Status::kZeroReceived:
      return "zero-received";
    case Status::kCapExceeded:
      return "cap-exceeded";
    case Status::kUnauthorizedCaller:
      return "unauthorized-caller";
    case Status::kInsufficientBalance:
      return "insufficient-balance";
    case Status::kNothingToForfeit:
      return "nothing-to-forfeit";
    case Status::kNotEmpty:
      return "not-empty";
    case Status::kReentrantCall:
      return "reentrant-call";
  }
  return "unknown";
}

std::uint16_t reject_code(Status status) noexcept {
  switch (status) {
    case Status::kOk:
      return 0;
    case Status::kInvalidAddress:
      return kRejectCodeInvalidAddress;
    case Status::kSelfSponsorship:
      return kRejectCodeSelfSponsorship;
    case Status::kInvalidAmount:
      return kRejectCodeInvalidAmount;
    case Status::kAssetNotEligible:
      return kRejectCodeAssetNotEligible;
    case Status::kSponsorLocked:
      return kRejectCodeSponsorLocked;
    case Status::kTransferFailed:
      return kRejectCodeTransferFailed;
    case Status::kZeroReceived:
      return kRejectCodeZeroReceived;
    case Status::kCapExceeded:
      return kRejectCodeCapExceeded;
    case Status::kUnauthorizedCaller:
      return kRejectCodeUnauthorizedCaller;
    case Status::kInsufficientBalance:
      return kRejectCodeInsufficientBalance;
    case Status::kNothingToForfeit:
      return kRejectCodeNothingToForfeit;
    case Status::kNotEmpty:
      return kRejectCodeNotEmpty;
    case Status::kReentrantCall:
      return kRejectCodeReentrantCall;
  }
  return 0;
}

LedgerCore::LedgerCore(LedgerStore& store,
                       const registry::EligibilityRegistry& registry,
                       sink::TransferMeter& meter,
                       const OwnershipControl& ownership,
                       audit::EventSink& events)
    : store_(store), registry_(registry), meter_(meter), ownership_(ownership), events_(events) {}

Status LedgerCore::validate_sponsor(const common::Address& caller,
                                    const common::Address& beneficiary,
                                    const common::AssetId& asset,
                                    common::Units amount) const {
  if (caller.is_null() || beneficiary.is_null() || asset.is_null()) {
    return Status::kInvalidAddress;
  }
  if (beneficiary == caller) {
    return Status::kSelfSponsorship;
  }
  if (amount == 0) {
    return Status::kInvalidAmount;
  }
  if (!registry_.lookup(asset).eligible()) {
    return Status::kAssetNotEligible;
  }
  return Status::kOk;
}

SponsorResult LedgerCore::sponsor(const common::Address& caller,
                                  const common::Address& beneficiary,
                                  const common::AssetId& asset,
                                  common::Units amount) {
  SponsorResult result{.requested = amount};
  if (transfer_in_flight_) {
    return rejected(result, Status::kReentrantCall);
  }
  if (const auto status = validate_sponsor(caller, beneficiary, asset, amount); status != Status::kOk) {
    return rejected(result, status);
  }

  // An emptied beneficiary can be adopted by a new sponsor.
  const auto current_sponsor = store_.sponsor_of(beneficiary);
  const bool assign = !current_sponsor || *current_sponsor != caller;
  if (current_sponsor && *current_sponsor != caller && store_.active_asset_count(beneficiary) > 0) {
    return rejected(result, Status::kSponsorLocked);
  }

  InFlightGuard guard{transfer_in_flight_};
  std::optional<PendingTransfer> pending;
  try {
    pending.emplace(meter_, meter_.transfer_and_measure(caller, asset, amount));
  } catch (const sink::TransferError&) {
    return rejected(result, Status::kTransferFailed);
  }

  const common::Units received = pending->receipt().received();
  if (received == 0) {
    return rejected(result, Status::kZeroReceived);
  }

  const auto cap = registry_.lookup(asset).cap_units;
  const common::Units prior_total = store_.cumulative_sponsored(asset);
  if (cap && (received > *cap || prior_total > *cap - received)) {
    return rejected(result, Status::kCapExceeded);
  }
  if (!fits(prior_total, received) || !fits(store_.balance_of(beneficiary, asset), received) ||
      !fits(store_.lifetime_allocated(beneficiary), received)) {
    throw std::overflow_error("sponsorship overflows ledger counters");
  }

  store_.add_cumulative_sponsored(asset, received);
  if (assign) {
    store_.assign_sponsor(beneficiary, caller);
  }
  result.new_balance = store_.credit(beneficiary, asset, received);
  store_.add_lifetime_allocated(beneficiary, received);
  pending->commit();
  result.received = received;

  events_.publish(audit::Sponsored{.beneficiary = beneficiary,
                                   .sponsor = caller,
                                   .asset = asset,
                                   .requested = amount,
                                   .new_balance = result.new_balance});
  events_.publish(audit::SponsoredReceived{.beneficiary = beneficiary,
                                           .sponsor = caller,
                                           .asset = asset,
                                           .requested = amount,
                                           .received = received});
  return result;
}

ConsumeResult LedgerCore::consume(const common::Address& caller,
                                  const common::Address& beneficiary,
                                  const common::AssetId& asset,
                                  common::Units amount) {
  ConsumeResult result;
  if (transfer_in_flight_) {
    return rejected(result, Status::kReentrantCall);
  }
  const auto& engine = store_.consuming_engine();
  if (!engine || caller != *engine) {
    return rejected(result, Status::kUnauthorizedCaller);
  }
  if (beneficiary.is_null() || asset.is_null()) {
    return rejected(result, Status::kInvalidAddress);
  }
  if (amount == 0) {
    return rejected(result, Status::kInvalidAmount);
  }
  if (amount > store_.balance_of(beneficiary, asset)) {
    return rejected(result, Status::kInsufficientBalance);
  }

  result.consumed = amount;
  result.remaining = store_.debit(beneficiary, asset, amount);
  events_.publish(audit::Consumed{.beneficiary = beneficiary,
                                  .asset = asset,
                                  .amount = amount,
                                  .remaining = result.remaining});
  return result;
}

ClearResult LedgerCore::clear_sponsor_if_empty(const common::Address& caller) {
  ClearResult result;
  if (transfer_in_flight_) {
    return rejected(result, Status::kReentrantCall);
  }
  const auto sponsor = store_.sponsor_of(caller);
  if (!sponsor) {
    return rejected(result, Status::kNothingToForfeit);
  }
  if (store_.active_asset_count(caller) != 0) {
    return rejected(result, Status::kNotEmpty);
  }

  store_.clear_sponsor(caller);
  result.previous_sponsor = sponsor;
  events_.publish(audit::SponsorCleared{.beneficiary = caller, .previous_sponsor = *sponsor});
  return result;
}

ForfeitResult LedgerCore::clear_sponsor_and_forfeit(const common::Address& caller,
                                                    std::span<const common::AssetId> assets) {
  ForfeitResult result;
  if (transfer_in_flight_) {
    return rejected(result, Status::kReentrantCall);
  }

  struct Forfeit {
    common::AssetId asset;
    common::Units amount;
  };
  std::vector<Forfeit> plan;
  common::Units total = 0;
  for (const auto& asset : assets) {
    const common::Units balance = store_.balance_of(caller, asset);
    if (balance == 0) {
      continue;
    }
    // A repeated asset is already zero by the time it would be revisited.
    const bool repeated = std::any_of(plan.begin(), plan.end(),
                                      [&](const Forfeit& f) { return f.asset == asset; });
    if (repeated) {
      continue;
    }
    if (!fits(total, balance)) {
      throw std::overflow_error("forfeited total overflows");
    }
    total += balance;
    plan.push_back(Forfeit{asset, balance});
  }

  if (total == 0) {
    return rejected(result, Status::kNothingToForfeit);
  }

  for (const auto& f : plan) {
    store_.set_balance(caller, f.asset, 0);
  }
  result.assets_cleared = static_cast<std::uint32_t>(plan.size());
  result.total_forfeited = total;

  const auto sponsor = store_.sponsor_of(caller);
  if (sponsor && store_.active_asset_count(caller) == 0) {
    store_.clear_sponsor(caller);
    result.sponsor_cleared = true;
  }

  for (const auto& f : plan) {
    events_.publish(audit::Forfeited{.beneficiary = caller, .asset = f.asset, .amount = f.amount});
  }
  if (result.sponsor_cleared) {
    events_.publish(audit::SponsorCleared{.beneficiary = caller, .previous_sponsor = *sponsor});
  }
  events_.publish(audit::ForfeitSummary{.beneficiary = caller,
                                        .assets_cleared = result.assets_cleared,
                                        .total_forfeited = total,
                                        .sponsor_cleared = result.sponsor_cleared});
  return result;
}

ConfigResult LedgerCore::set_consuming_engine(const common::Address& caller, const common::Address& engine) {
  ConfigResult result;
  if (transfer_in_flight_) {
    return rejected(result, Status::kReentrantCall);
  }
  if (!ownership_.is_owner(caller)) {
    return rejected(result, Status::kUnauthorizedCaller);
  }
  if (engine.is_null()) {
    return rejected(result, Status::kInvalidAddress);
  }

  const common::Address previous = store_.consuming_engine().value_or(common::Address{});
  store_.set_consuming_engine(engine);
  events_.publish(audit::EngineConfigured{.previous_engine = previous, .engine = engine});
  return result;
}

}  // namespace ledger
}  // namespace unitledger
