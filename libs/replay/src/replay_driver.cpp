#include "unitledger/replay/replay_driver.hpp"

#include <stdexcept>

namespace unitledger {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path journal_path) {
  snapshot_store_.prepare(snapshot_directory);
  journal_path_ = std::move(journal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_record_handler(RecordHandler handler) {
  record_handler_ = std::move(handler);
}

common::SequenceId Driver::execute() {
  if (!record_handler_) {
    throw std::runtime_error("record handler not set for replay");
  }

  common::SequenceId last_sequence{0};

  if (auto snap = snapshot_store_.latest()) {
    last_sequence = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload.data(), snap->payload.size()));
    }
  }

  if (!std::filesystem::exists(journal_path_)) {
    return last_sequence;
  }

  journal::Reader reader(journal_path_);
  journal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence <= last_sequence) {
      continue;
    }
    record_handler_(record);
    last_sequence = record.header.sequence;
  }
  return last_sequence;
}

}  // namespace replay
}  // namespace unitledger
