#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace audit {

enum class EventKind : std::uint8_t {
  kEngineConfigured = 1,
  kSponsored = 2,
  kSponsoredReceived = 3,
  kConsumed = 4,
  kForfeited = 5,
  kSponsorCleared = 6,
  kForfeitSummary = 7,
  kOwnershipTransferStarted = 8,
  kOwnershipTransferred = 9,
};

struct EngineConfigured {
  common::Address previous_engine{};
  common::Address engine{};
};

struct Sponsored {
  common::Address beneficiary{};
  common::Address sponsor{};
  common::AssetId asset{};
  common::Units requested{0};
  common::Units new_balance{0};
};

struct SponsoredReceived {
  common::Address beneficiary{};
  common::Address sponsor{};
  common::AssetId asset{};
  common::Units requested{0};
  common::Units received{0};
};

struct Consumed {
  common::Address beneficiary{};
  common::AssetId asset{};
  common::Units amount{0};
  common::Units remaining{0};
};

struct Forfeited {
  common::Address beneficiary{};
  common::AssetId asset{};
  common::Units amount{0};
};

struct SponsorCleared {
  common::Address beneficiary{};
  common::Address previous_sponsor{};
};

struct ForfeitSummary {
  common::Address beneficiary{};
  std::uint32_t assets_cleared{0};
  common::Units total_forfeited{0};
  bool sponsor_cleared{false};
};

struct OwnershipTransferStarted {
  common::Address owner{};
  common::Address pending_owner{};
};

struct OwnershipTransferred {
  common::Address previous_owner{};
  common::Address new_owner{};
};

using Event = std::variant<EngineConfigured,
                           Sponsored,
                           SponsoredReceived,
                           Consumed,
                           Forfeited,
                           SponsorCleared,
                           ForfeitSummary,
                           OwnershipTransferStarted,
                           OwnershipTransferred>;

EventKind kind_of(const Event& event) noexcept;
std::string_view to_string(EventKind kind) noexcept;

}  // namespace audit
}  // namespace unitledger
