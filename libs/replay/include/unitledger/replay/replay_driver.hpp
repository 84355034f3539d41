#pragma once

#include <filesystem>
#include <functional>
#include <span>

#include "unitledger/audit/journal.hpp"
#include "unitledger/common/types.hpp"
#include "unitledger/snapshot/snapshot_store.hpp"

namespace unitledger {
namespace replay {

class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using RecordHandler = std::function<void(const journal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path journal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_record_handler(RecordHandler handler);

  // Feeds the latest snapshot, then every journal record past it. Returns the last
  // sequence covered.
  common::SequenceId execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path journal_path_{};
  SnapshotHandler snapshot_handler_{};
  RecordHandler record_handler_{};
};

}  // namespace replay
}  // namespace unitledger
