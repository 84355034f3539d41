#include "unitledger/replay/ledger_rebuilder.hpp"

#include <optional>
#include <stdexcept>
#include <type_traits>

#include "unitledger/audit/event_codec.hpp"
#include "unitledger/common/byte_codec.hpp"

namespace unitledger {
namespace replay {

namespace codec = common::codec;

namespace {
constexpr std::uint32_t kSnapshotMagic = 0x444e4c55;  // 'ULND'
constexpr std::uint16_t kSnapshotVersion = 1;

void append_section(std::vector<std::byte>& buffer, const std::vector<std::byte>& section) {
  codec::append_primitive<std::uint32_t>(buffer, static_cast<std::uint32_t>(section.size()));
  buffer.insert(buffer.end(), section.begin(), section.end());
}

std::span<const std::byte> read_section(std::span<const std::byte> data, std::size_t& offset) {
  const auto size = codec::read_primitive<std::uint32_t>(data, offset);
  if (offset + size > data.size()) {
    throw std::runtime_error("truncated snapshot section");
  }
  const auto section = data.subspan(offset, size);
  offset += size;
  return section;
}

}  // namespace

LedgerRebuilder::LedgerRebuilder(ledger::LedgerStore& store,
                                 sink::InMemoryAssetBook& book,
                                 ledger::OwnershipControl& ownership,
                                 common::Address sink_address)
    : store_(store), book_(book), ownership_(ownership), sink_address_(sink_address) {
  if (sink_address_.is_null()) {
    throw std::invalid_argument("sink address cannot be null");
  }
}

std::vector<std::byte> LedgerRebuilder::encode_snapshot() const {
  std::vector<std::byte> buffer;
  codec::append_primitive<std::uint32_t>(buffer, kSnapshotMagic);
  codec::append_primitive<std::uint16_t>(buffer, kSnapshotVersion);
  append_section(buffer, store_.encode());
  append_section(buffer, book_.encode());
  codec::append_address(buffer, ownership_.owner());
  codec::append_address(buffer, ownership_.pending_owner().value_or(common::Address{}));
  return buffer;
}

void LedgerRebuilder::load_snapshot(std::span<const std::byte> payload) {
  std::size_t offset = 0;
  if (codec::read_primitive<std::uint32_t>(payload, offset) != kSnapshotMagic) {
    throw std::runtime_error("invalid node snapshot magic");
  }
  if (codec::read_primitive<std::uint16_t>(payload, offset) != kSnapshotVersion) {
    throw std::runtime_error("unsupported node snapshot version");
  }
  auto store = ledger::LedgerStore::decode(read_section(payload, offset));
  const auto book_section = read_section(payload, offset);
  const auto owner = codec::read_address(payload, offset);
  const auto pending = codec::read_address(payload, offset);
  if (offset != payload.size()) {
    throw std::runtime_error("trailing bytes after node snapshot");
  }

  book_.restore(book_section);
  store_ = std::move(store);
  ownership_.restore(owner, pending.is_null() ? std::nullopt : std::optional<common::Address>{pending});
}

void LedgerRebuilder::apply(const journal::Record& record) {
  apply(audit::decode(record.payload));
}

void LedgerRebuilder::apply(const audit::Event& event) {
  std::visit(
      [&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, audit::EngineConfigured>) {
          store_.set_consuming_engine(e.engine);
        } else if constexpr (std::is_same_v<T, audit::Sponsored>) {
          if (store_.sponsor_of(e.beneficiary) != e.sponsor) {
            store_.assign_sponsor(e.beneficiary, e.sponsor);
          }
          store_.set_balance(e.beneficiary, e.asset, e.new_balance);
        } else if constexpr (std::is_same_v<T, audit::SponsoredReceived>) {
          store_.add_cumulative_sponsored(e.asset, e.received);
          store_.add_lifetime_allocated(e.beneficiary, e.received);
          book_.apply_settled_transfer(e.asset, e.sponsor, sink_address_, e.requested, e.received);
        } else if constexpr (std::is_same_v<T, audit::Consumed>) {
          store_.set_balance(e.beneficiary, e.asset, e.remaining);
        } else if constexpr (std::is_same_v<T, audit::Forfeited>) {
          store_.set_balance(e.beneficiary, e.asset, 0);
        } else if constexpr (std::is_same_v<T, audit::SponsorCleared>) {
          store_.clear_sponsor(e.beneficiary);
        } else if constexpr (std::is_same_v<T, audit::OwnershipTransferStarted>) {
          ownership_.restore(e.owner, e.pending_owner.is_null()
                                          ? std::nullopt
                                          : std::optional<common::Address>{e.pending_owner});
        } else if constexpr (std::is_same_v<T, audit::OwnershipTransferred>) {
          ownership_.restore(e.new_owner, std::nullopt);
        }
      },
      event);
  ++events_applied_;
}

}  // namespace replay
}  // namespace unitledger
