#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "unitledger/audit/events.hpp"
#include "unitledger/audit/journal.hpp"
#include "unitledger/common/types.hpp"
#include "unitledger/ledger/ledger_store.hpp"
#include "unitledger/ledger/ownership_control.hpp"
#include "unitledger/sink/asset_book.hpp"

namespace unitledger {
namespace replay {

// Folds audit records back into the recoverable state of a node: the ledger store, the
// asset book the sink lives in, and the ownership handoff.
class LedgerRebuilder {
 public:
  LedgerRebuilder(ledger::LedgerStore& store,
                  sink::InMemoryAssetBook& book,
                  ledger::OwnershipControl& ownership,
                  common::Address sink_address);

  // Snapshot payload: [magic][version][store][book][owner][pending owner], each section
  // length-prefixed.
  [[nodiscard]] std::vector<std::byte> encode_snapshot() const;
  void load_snapshot(std::span<const std::byte> payload);

  void apply(const journal::Record& record);
  void apply(const audit::Event& event);

  [[nodiscard]] std::size_t events_applied() const noexcept { return events_applied_; }

 private:
  ledger::LedgerStore& store_;
  sink::InMemoryAssetBook& book_;
  ledger::OwnershipControl& ownership_;
  common::Address sink_address_;
  std::size_t events_applied_{0};
};

}  // namespace replay
}  // namespace unitledger
