#pragma once

#include <cstddef>
#include <memory>

#include "unitledger/audit/event_sink.hpp"
#include "unitledger/audit/journal.hpp"
#include "unitledger/common/types.hpp"
#include "unitledger/config/config_loader.hpp"
#include "unitledger/ledger/ledger_core.hpp"
#include "unitledger/ledger/ledger_store.hpp"
#include "unitledger/ledger/ownership_control.hpp"
#include "unitledger/registry/eligibility_registry.hpp"
#include "unitledger/replay/ledger_rebuilder.hpp"
#include "unitledger/sink/asset_book.hpp"
#include "unitledger/sink/transfer_meter.hpp"

namespace unitledger {
namespace node {

// One ledger process: registry and asset book from configuration, state recovered from the
// latest snapshot plus the audit journal, every new record appended to that journal.
class LedgerNode {
 public:
  explicit LedgerNode(config::NodeConfig config);
  LedgerNode(const LedgerNode&) = delete;
  LedgerNode& operator=(const LedgerNode&) = delete;
  ~LedgerNode();

  // Genesis holdings seed the asset book only when no snapshot exists; journal records
  // past the snapshot are then replayed on top. Seeds the consuming engine from
  // configuration if none was recovered. Returns the last journal sequence covered.
  common::SequenceId recover();

  // Batch operation with op.caller as the caller.
  ledger::Status apply(const config::Operation& op);

  void sync();
  // Syncs the journal and snapshots the node at its last sequence.
  common::SequenceId persist_snapshot();

  [[nodiscard]] const config::NodeConfig& config() const noexcept { return config_; }
  [[nodiscard]] const ledger::LedgerStore& store() const noexcept { return store_; }
  [[nodiscard]] const sink::InMemoryAssetBook& book() const noexcept { return book_; }
  [[nodiscard]] const ledger::OwnershipControl& ownership() const noexcept { return *ownership_; }
  [[nodiscard]] ledger::LedgerCore& core() noexcept { return *core_; }
  [[nodiscard]] common::SequenceId journal_sequence() const noexcept { return journal_->last_sequence(); }
  [[nodiscard]] std::size_t records_replayed() const noexcept { return rebuilder_->events_applied(); }

 private:
  config::NodeConfig config_;
  registry::StaticRegistry registry_{};
  sink::InMemoryAssetBook book_{};
  ledger::LedgerStore store_{};
  std::unique_ptr<journal::Writer> journal_;
  std::unique_ptr<audit::JournalSink> journal_sink_;
  std::unique_ptr<ledger::OwnershipControl> ownership_;
  std::unique_ptr<sink::SinkTransferMeter> meter_;
  std::unique_ptr<ledger::LedgerCore> core_;
  std::unique_ptr<replay::LedgerRebuilder> rebuilder_;
  bool recovered_{false};
};

}  // namespace node
}  // namespace unitledger
