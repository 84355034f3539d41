#include "unitledger/audit/event_codec.hpp"

#include <stdexcept>
#include <type_traits>

#include "unitledger/common/byte_codec.hpp"

namespace unitledger {
namespace audit {

namespace codec = common::codec;

EventKind kind_of(const Event& event) noexcept {
  return static_cast<EventKind>(event.index() + 1);
}

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kEngineConfigured:
      return "EngineConfigured";
    case EventKind::kSponsored:
      return "Sponsored";
    case EventKind::kSponsoredReceived:
      return "SponsoredReceived";
    case EventKind::kConsumed:
      return "Consumed";
    case EventKind::kForfeited:
      return "Forfeited";
    case EventKind::kSponsorCleared:
      return "SponsorCleared";
    case EventKind::kForfeitSummary:
      return "ForfeitSummary";
    case EventKind::kOwnershipTransferStarted:
      return "OwnershipTransferStarted";
    case EventKind::kOwnershipTransferred:
      return "OwnershipTransferred";
  }
  return "Unknown";
}

std::vector<std::byte> encode(const Event& event) {
  std::vector<std::byte> buffer;
  buffer.reserve(1 + common::kAddressSize * 3 + sizeof(common::Units) * 2);
  codec::append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(kind_of(event)));

  std::visit(
      [&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, EngineConfigured>) {
          codec::append_address(buffer, e.previous_engine);
          codec::append_address(buffer, e.engine);
        } else if constexpr (std::is_same_v<T, Sponsored>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_address(buffer, e.sponsor);
          codec::append_address(buffer, e.asset);
          codec::append_primitive<common::Units>(buffer, e.requested);
          codec::append_primitive<common::Units>(buffer, e.new_balance);
        } else if constexpr (std::is_same_v<T, SponsoredReceived>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_address(buffer, e.sponsor);
          codec::append_address(buffer, e.asset);
          codec::append_primitive<common::Units>(buffer, e.requested);
          codec::append_primitive<common::Units>(buffer, e.received);
        } else if constexpr (std::is_same_v<T, Consumed>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_address(buffer, e.asset);
          codec::append_primitive<common::Units>(buffer, e.amount);
          codec::append_primitive<common::Units>(buffer, e.remaining);
        } else if constexpr (std::is_same_v<T, Forfeited>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_address(buffer, e.asset);
          codec::append_primitive<common::Units>(buffer, e.amount);
        } else if constexpr (std::is_same_v<T, SponsorCleared>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_address(buffer, e.previous_sponsor);
        } else if constexpr (std::is_same_v<T, ForfeitSummary>) {
          codec::append_address(buffer, e.beneficiary);
          codec::append_primitive<std::uint32_t>(buffer, e.assets_cleared);
          codec::append_primitive<common::Units>(buffer, e.total_forfeited);
          codec::append_primitive<std::uint8_t>(buffer, e.sponsor_cleared ? 1 : 0);
        } else if constexpr (std::is_same_v<T, OwnershipTransferStarted>) {
          codec::append_address(buffer, e.owner);
          codec::append_address(buffer, e.pending_owner);
        } else if constexpr (std::is_same_v<T, OwnershipTransferred>) {
          codec::append_address(buffer, e.previous_owner);
          codec::append_address(buffer, e.new_owner);
        }
      },
      event);
  return buffer;
}

Event decode(std::span<const std::byte> data) {
  std::size_t offset = 0;
  const auto kind = static_cast<EventKind>(codec::read_primitive<std::uint8_t>(data, offset));

  Event event;
  switch (kind) {
    case EventKind::kEngineConfigured: {
      EngineConfigured e;
      e.previous_engine = codec::read_address(data, offset);
      e.engine = codec::read_address(data, offset);
      event = e;
      break;
    }
    case EventKind::kSponsored: {
      Sponsored e;
      e.beneficiary = codec::read_address(data, offset);
      e.sponsor = codec::read_address(data, offset);
      e.asset = codec::read_address(data, offset);
      e.requested = codec::read_primitive<common::Units>(data, offset);
      e.new_balance = codec::read_primitive<common::Units>(data, offset);
      event = e;
      break;
    }
    case EventKind::kSponsoredReceived: {
      SponsoredReceived e;
      e.beneficiary = codec::read_address(data, offset);
      e.sponsor = codec::read_address(data, offset);
      e.asset = codec::read_address(data, offset);
      e.requested = codec::read_primitive<common::Units>(data, offset);
      e.received = codec::read_primitive<common::Units>(data, offset);
      event = e;
      break;
    }
    case EventKind::kConsumed: {
      Consumed e;
      e.beneficiary = codec::read_address(data, offset);
      e.asset = codec::read_address(data, offset);
      e.amount = codec::read_primitive<common::Units>(data, offset);
      e.remaining = codec::read_primitive<common::Units>(data, offset);
      event = e;
      break;
    }
    case EventKind::kForfeited: {
      Forfeited e;
      e.beneficiary = codec::read_address(data, offset);
      e.asset = codec::read_address(data, offset);
      e.amount = codec::read_primitive<common::Units>(data, offset);
      event = e;
      break;
    }
    case EventKind::kSponsorCleared: {
      SponsorCleared e;
      e.beneficiary = codec::read_address(data, offset);
      e.previous_sponsor = codec::read_address(data, offset);
      event = e;
      break;
    }
    case EventKind::kForfeitSummary: {
      ForfeitSummary e;
      e.beneficiary = codec::read_address(data, offset);
      e.assets_cleared = codec::read_primitive<std::uint32_t>(data, offset);
      e.total_forfeited = codec::read_primitive<common::Units>(data, offset);
      e.sponsor_cleared = codec::read_primitive<std::uint8_t>(data, offset) != 0;
      event = e;
      break;
    }
    case EventKind::kOwnershipTransferStarted: {
      OwnershipTransferStarted e;
      e.owner = codec::read_address(data, offset);
      e.pending_owner = codec::read_address(data, offset);
      event = e;
      break;
    }
    case EventKind::kOwnershipTransferred: {
      OwnershipTransferred e;
      e.previous_owner = codec::read_address(data, offset);
      e.new_owner = codec::read_address(data, offset);
      event = e;
      break;
    }
    default:
      throw std::runtime_error("unknown audit event kind");
  }

  if (offset != data.size()) {
    throw std::runtime_error("trailing bytes after audit event");
  }
  return event;
}

}  // namespace audit
}  // namespace unitledger
