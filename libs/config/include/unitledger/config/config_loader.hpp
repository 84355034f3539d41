#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace config {

struct LedgerConfig {
  common::Address owner{};
  std::optional<common::Address> consuming_engine{};
};

struct SinkConfig {
  common::Address address{common::Address::from_id(0xdead)};
};

struct PersistenceConfig {
  std::filesystem::path journal_path{"/var/lib/unitledger/audit.journal"};
  std::filesystem::path snapshot_dir{"/var/lib/unitledger/snapshots"};
  std::size_t journal_flush_threshold{4096};
};

struct AssetConfig {
  common::AssetId address{};
  std::string symbol{};
  bool listed{true};
  bool enabled{true};
  std::uint8_t decimals{18};
  common::Units units_per_reference_amount{1};
  common::Units cap_units{0};  // 0 = uncapped
  std::uint32_t transfer_fee_bp{0};
};

// Opening holdings of the simulated asset book.
struct GenesisAllocation {
  common::AssetId asset{};
  common::Address holder{};
  common::Units amount{0};
};

struct NodeConfig {
  LedgerConfig ledger;
  SinkConfig sink;
  PersistenceConfig persistence;
  std::vector<AssetConfig> assets;
  std::vector<GenesisAllocation> genesis;
};

enum class OperationKind : std::uint8_t {
  kSponsor,
  kConsume,
  kClearIfEmpty,
  kClearAndForfeit,
  kSetEngine,
  kTransferOwnership,
  kAcceptOwnership,
};

struct Operation {
  OperationKind kind{OperationKind::kSponsor};
  common::Address caller{};
  common::Address beneficiary{};
  common::AssetId asset{};
  common::Units amount{0};
  std::vector<common::AssetId> assets{};
  common::Address target{};
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  NodeConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

struct BatchResult {
  bool success{false};
  std::vector<Operation> operations;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const NodeConfig& config);
  static std::string generate_default();

  static BatchResult load_batch(const std::filesystem::path& path);
  static BatchResult load_batch_from_string(std::string_view toml_content);
};

}  // namespace config
}  // namespace unitledger
