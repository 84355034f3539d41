#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "unitledger/audit/event_sink.hpp"
#include "unitledger/common/types.hpp"
#include "unitledger/ledger/ledger_store.hpp"
#include "unitledger/ledger/ownership_control.hpp"
#include "unitledger/registry/eligibility_registry.hpp"
#include "unitledger/sink/transfer_meter.hpp"

namespace unitledger {
namespace ledger {

enum class Status : std::uint8_t {
  kOk,
  kInvalidAddress,
  kSelfSponsorship,
  kInvalidAmount,
  kAssetNotEligible,
  kSponsorLocked,
  kTransferFailed,
  kZeroReceived,
  kCapExceeded,
  kUnauthorizedCaller,
  kInsufficientBalance,
  kNothingToForfeit,
  kNotEmpty,
  kReentrantCall,
};

std::string_view to_string(Status status) noexcept;
std::uint16_t reject_code(Status status) noexcept;

struct SponsorResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  common::Units requested{0};
  common::Units received{0};
  common::Units new_balance{0};
};

struct ConsumeResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  common::Units consumed{0};
  common::Units remaining{0};
};

struct ClearResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  std::optional<common::Address> previous_sponsor{};
};

struct ForfeitResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
  std::uint32_t assets_cleared{0};
  common::Units total_forfeited{0};
  bool sponsor_cleared{false};
};

struct ConfigResult {
  Status status{Status::kOk};
  std::uint16_t reject_code{0};
};

// Sponsor/consume/forfeit state machine over a LedgerStore. Every operation either applies
// completely or returns a non-kOk status with store, asset book and audit log untouched.
class LedgerCore {
 public:
  LedgerCore(LedgerStore& store,
             const registry::EligibilityRegistry& registry,
             sink::TransferMeter& meter,
             const OwnershipControl& ownership,
             audit::EventSink& events);

  SponsorResult sponsor(const common::Address& caller,
                        const common::Address& beneficiary,
                        const common::AssetId& asset,
                        common::Units amount);

  // Only the configured consuming engine may debit.
  ConsumeResult consume(const common::Address& caller,
                        const common::Address& beneficiary,
                        const common::AssetId& asset,
                        common::Units amount);

  ClearResult clear_sponsor_if_empty(const common::Address& caller);

  // Forfeits only the listed assets. Listing a subset can leave the sponsor assigned.
  ForfeitResult clear_sponsor_and_forfeit(const common::Address& caller,
                                          std::span<const common::AssetId> assets);

  ConfigResult set_consuming_engine(const common::Address& caller, const common::Address& engine);

  [[nodiscard]] std::optional<common::Address> sponsor_of(const common::Address& beneficiary) const {
    return store_.sponsor_of(beneficiary);
  }
  [[nodiscard]] common::Units balance_of(const common::Address& beneficiary, const common::AssetId& asset) const {
    return store_.balance_of(beneficiary, asset);
  }
  [[nodiscard]] std::uint32_t active_asset_count(const common::Address& beneficiary) const {
    return store_.active_asset_count(beneficiary);
  }
  [[nodiscard]] common::Units cumulative_sponsored(const common::AssetId& asset) const {
    return store_.cumulative_sponsored(asset);
  }
  [[nodiscard]] common::Units lifetime_allocated(const common::Address& beneficiary) const {
    return store_.lifetime_allocated(beneficiary);
  }
  [[nodiscard]] std::optional<common::Address> consuming_engine() const { return store_.consuming_engine(); }
  [[nodiscard]] const LedgerStore& store() const noexcept { return store_; }

 private:
  LedgerStore& store_;
  const registry::EligibilityRegistry& registry_;
  sink::TransferMeter& meter_;
  const OwnershipControl& ownership_;
  audit::EventSink& events_;
  bool transfer_in_flight_{false};

  [[nodiscard]] Status validate_sponsor(const common::Address& caller,
                                        const common::Address& beneficiary,
                                        const common::AssetId& asset,
                                        common::Units amount) const;
};

}  // namespace ledger
}  // namespace unitledger
