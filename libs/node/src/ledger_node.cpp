#include "unitledger/node/ledger_node.hpp"

#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "unitledger/replay/replay_driver.hpp"
#include "unitledger/snapshot/snapshot_store.hpp"

namespace unitledger {
namespace node {

LedgerNode::LedgerNode(config::NodeConfig config) : config_(std::move(config)) {
  for (const auto& asset_cfg : config_.assets) {
    registry_.list_asset(asset_cfg.address, {
        .listed = asset_cfg.listed,
        .enabled = asset_cfg.enabled,
        .decimals = asset_cfg.decimals,
        .units_per_reference_amount = asset_cfg.units_per_reference_amount,
        .cap_units = registry::cap_from_raw(asset_cfg.cap_units),
    });
    if (!asset_cfg.listed) {
      registry_.delist_asset(asset_cfg.address);
    }
    book_.set_fee_basis_points(asset_cfg.address, asset_cfg.transfer_fee_bp);
  }

  const auto& persistence = config_.persistence;
  std::filesystem::create_directories(persistence.snapshot_dir);
  if (persistence.journal_path.has_parent_path()) {
    std::filesystem::create_directories(persistence.journal_path.parent_path());
  }

  journal_ = std::make_unique<journal::Writer>(persistence.journal_path, persistence.journal_flush_threshold);
  journal_sink_ = std::make_unique<audit::JournalSink>(*journal_);
  ownership_ = std::make_unique<ledger::OwnershipControl>(config_.ledger.owner, *journal_sink_);
  meter_ = std::make_unique<sink::SinkTransferMeter>(book_, config_.sink.address);
  core_ = std::make_unique<ledger::LedgerCore>(store_, registry_, *meter_, *ownership_, *journal_sink_);
  rebuilder_ = std::make_unique<replay::LedgerRebuilder>(store_, book_, *ownership_, config_.sink.address);
}

LedgerNode::~LedgerNode() = default;

common::SequenceId LedgerNode::recover() {
  if (recovered_) {
    throw std::logic_error("ledger node already recovered");
  }

  // A snapshot replaces these balances wholesale.
  for (const auto& allocation : config_.genesis) {
    book_.mint(allocation.asset, allocation.holder, allocation.amount);
  }

  replay::Driver driver;
  driver.configure(config_.persistence.snapshot_dir, config_.persistence.journal_path);
  driver.set_snapshot_handler([&](common::SequenceId, std::span<const std::byte> payload) {
    rebuilder_->load_snapshot(payload);
  });
  driver.set_record_handler([&](const journal::Record& record) { rebuilder_->apply(record); });

  const auto sequence = driver.execute();
  if (!store_.check_invariants()) {
    throw std::runtime_error("recovered ledger violates invariants");
  }
  recovered_ = true;

  // Configuration only fills the gap; an engine set through the admin path stays.
  if (config_.ledger.consuming_engine && !store_.consuming_engine()) {
    const auto result = core_->set_consuming_engine(ownership_->owner(), *config_.ledger.consuming_engine);
    if (result.status != ledger::Status::kOk) {
      throw std::runtime_error("failed to seed consuming engine: " + std::string(ledger::to_string(result.status)));
    }
  }
  return sequence;
}

ledger::Status LedgerNode::apply(const config::Operation& op) {
  using config::OperationKind;
  using ledger::Status;

  if (!recovered_) {
    throw std::logic_error("ledger node used before recovery");
  }
  switch (op.kind) {
    case OperationKind::kSponsor:
      return core_->sponsor(op.caller, op.beneficiary, op.asset, op.amount).status;
    case OperationKind::kConsume:
      return core_->consume(op.caller, op.beneficiary, op.asset, op.amount).status;
    case OperationKind::kClearIfEmpty:
      return core_->clear_sponsor_if_empty(op.caller).status;
    case OperationKind::kClearAndForfeit:
      return core_->clear_sponsor_and_forfeit(op.caller, op.assets).status;
    case OperationKind::kSetEngine:
      return core_->set_consuming_engine(op.caller, op.target).status;
    case OperationKind::kTransferOwnership:
      return ownership_->transfer_ownership(op.caller, op.target) ? Status::kOk : Status::kUnauthorizedCaller;
    case OperationKind::kAcceptOwnership:
      return ownership_->accept_ownership(op.caller) ? Status::kOk : Status::kUnauthorizedCaller;
  }
  throw std::logic_error("unknown operation kind");
}

void LedgerNode::sync() {
  journal_->sync();
}

common::SequenceId LedgerNode::persist_snapshot() {
  journal_->sync();
  snapshot::Store snapshots{config_.persistence.snapshot_dir};
  snapshots.persist(journal_->last_sequence(), rebuilder_->encode_snapshot());
  return journal_->last_sequence();
}

}  // namespace node
}  // namespace unitledger
