#include "unitledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <set>
#include <sstream>

namespace unitledger {
namespace config {

namespace {

using Errors = std::vector<ValidationError>;

constexpr std::uint32_t kMaxFeeBasisPoints = 10'000;
// The journal writer reserves its whole flush buffer up front.
constexpr std::size_t kMaxJournalFlushThreshold = std::size_t{64} << 20;

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::optional<common::Address> parse_address(const toml::node_view<const toml::node>& node,
                                             const std::string& field,
                                             Errors& errors) {
  if (!node) {
    return std::nullopt;
  }
  auto text = node.value<std::string_view>();
  if (!text) {
    errors.push_back({field, "must be a hex string"});
    return std::nullopt;
  }
  auto addr = common::Address::from_hex(*text);
  if (!addr) {
    errors.push_back({field, "not a 20-byte hex address"});
  }
  return addr;
}

common::Address get_address_or(const toml::table& tbl, std::string_view key, const std::string& field,
                               common::Address default_val, Errors& errors) {
  return parse_address(tbl[key], field, errors).value_or(default_val);
}

common::Units get_units_or(const toml::table& tbl, std::string_view key, const std::string& field,
                           common::Units default_val, Errors& errors) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    if (*val < 0) {
      errors.push_back({field, "must not be negative"});
      return default_val;
    }
    return static_cast<common::Units>(*val);
  }
  return default_val;
}

LedgerConfig parse_ledger(const toml::table& root, Errors& errors) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.owner = get_address_or(*ledger, "owner", "ledger.owner", cfg.owner, errors);
    cfg.consuming_engine = parse_address((*ledger)["consuming_engine"], "ledger.consuming_engine", errors);
  }
  return cfg;
}

SinkConfig parse_sink(const toml::table& root, Errors& errors) {
  SinkConfig cfg;
  if (auto* sink = root["sink"].as_table()) {
    cfg.address = get_address_or(*sink, "address", "sink.address", cfg.address, errors);
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root, Errors& errors) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.journal_path = get_str_or(*persistence, "journal_path", cfg.journal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.journal_flush_threshold = static_cast<std::size_t>(
        get_units_or(*persistence, "journal_flush_threshold", "persistence.journal_flush_threshold",
                     cfg.journal_flush_threshold, errors));
  }
  return cfg;
}

std::vector<AssetConfig> parse_assets(const toml::table& root, Errors& errors) {
  std::vector<AssetConfig> assets;
  if (auto* arr = root["assets"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* asset_tbl = arr->get(i)->as_table();
      if (!asset_tbl) {
        continue;
      }
      const std::string prefix = "assets[" + std::to_string(i) + "]";
      AssetConfig asset;
      asset.address = get_address_or(*asset_tbl, "address", prefix + ".address", asset.address, errors);
      asset.symbol = get_str_or(*asset_tbl, "symbol", asset.symbol);
      asset.listed = get_bool_or(*asset_tbl, "listed", asset.listed);
      asset.enabled = get_bool_or(*asset_tbl, "enabled", asset.enabled);

      const auto decimals = get_int_or(*asset_tbl, "decimals", asset.decimals);
      if (decimals < 0 || decimals > 255) {
        errors.push_back({prefix + ".decimals", "must be between 0 and 255"});
      } else {
        asset.decimals = static_cast<std::uint8_t>(decimals);
      }

      asset.units_per_reference_amount = get_units_or(*asset_tbl, "units_per_reference_amount",
                                                      prefix + ".units_per_reference_amount",
                                                      asset.units_per_reference_amount, errors);
      asset.cap_units = get_units_or(*asset_tbl, "cap_units", prefix + ".cap_units", asset.cap_units, errors);

      const auto fee = get_int_or(*asset_tbl, "transfer_fee_bp", asset.transfer_fee_bp);
      if (fee < 0 || fee > kMaxFeeBasisPoints) {
        errors.push_back({prefix + ".transfer_fee_bp", "must be between 0 and 10000"});
      } else {
        asset.transfer_fee_bp = static_cast<std::uint32_t>(fee);
      }
      assets.push_back(std::move(asset));
    }
  }
  return assets;
}

std::vector<GenesisAllocation> parse_genesis(const toml::table& root, Errors& errors) {
  std::vector<GenesisAllocation> genesis;
  if (auto* arr = root["genesis"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = arr->get(i)->as_table();
      if (!tbl) {
        continue;
      }
      const std::string prefix = "genesis[" + std::to_string(i) + "]";
      GenesisAllocation allocation;
      allocation.asset = get_address_or(*tbl, "asset", prefix + ".asset", allocation.asset, errors);
      allocation.holder = get_address_or(*tbl, "holder", prefix + ".holder", allocation.holder, errors);
      allocation.amount = get_units_or(*tbl, "amount", prefix + ".amount", allocation.amount, errors);
      genesis.push_back(allocation);
    }
  }
  return genesis;
}

NodeConfig parse_config(const toml::table& root, Errors& errors) {
  NodeConfig cfg;
  cfg.ledger = parse_ledger(root, errors);
  cfg.sink = parse_sink(root, errors);
  cfg.persistence = parse_persistence(root, errors);
  cfg.assets = parse_assets(root, errors);
  cfg.genesis = parse_genesis(root, errors);
  return cfg;
}

LoadResult finish_load(const toml::table& root) {
  LoadResult result;
  result.config = parse_config(root, result.errors);
  auto validation = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), validation.begin(), validation.end());
  result.success = result.errors.empty();
  return result;
}

std::optional<OperationKind> parse_kind(std::string_view kind) {
  if (kind == "sponsor") return OperationKind::kSponsor;
  if (kind == "consume") return OperationKind::kConsume;
  if (kind == "clear_if_empty") return OperationKind::kClearIfEmpty;
  if (kind == "clear_and_forfeit") return OperationKind::kClearAndForfeit;
  if (kind == "set_engine") return OperationKind::kSetEngine;
  if (kind == "transfer_ownership") return OperationKind::kTransferOwnership;
  if (kind == "accept_ownership") return OperationKind::kAcceptOwnership;
  return std::nullopt;
}

void require_address(const toml::table& tbl, std::string_view key, const std::string& prefix,
                     common::Address& out, Errors& errors) {
  const std::string field = prefix + "." + std::string(key);
  if (!tbl.contains(key)) {
    errors.push_back({field, "required for this kind"});
    return;
  }
  out = get_address_or(tbl, key, field, out, errors);
}

BatchResult finish_batch(const toml::table& root) {
  BatchResult result;
  auto& errors = result.errors;

  if (auto* arr = root["ops"].as_array()) {
    for (std::size_t i = 0; i < arr->size(); ++i) {
      auto* tbl = arr->get(i)->as_table();
      const std::string prefix = "ops[" + std::to_string(i) + "]";
      if (!tbl) {
        errors.push_back({prefix, "must be a table"});
        continue;
      }

      const auto kind = parse_kind(get_str_or(*tbl, "kind", ""));
      if (!kind) {
        errors.push_back({prefix + ".kind", "unknown operation kind"});
        continue;
      }

      Operation op;
      op.kind = *kind;
      require_address(*tbl, "caller", prefix, op.caller, errors);

      switch (op.kind) {
        case OperationKind::kSponsor:
        case OperationKind::kConsume:
          require_address(*tbl, "beneficiary", prefix, op.beneficiary, errors);
          require_address(*tbl, "asset", prefix, op.asset, errors);
          op.amount = get_units_or(*tbl, "amount", prefix + ".amount", op.amount, errors);
          break;
        case OperationKind::kClearAndForfeit:
          if (auto* assets = (*tbl)["assets"].as_array()) {
            for (std::size_t j = 0; j < assets->size(); ++j) {
              const std::string field = prefix + ".assets[" + std::to_string(j) + "]";
              if (auto addr = parse_address(toml::node_view<const toml::node>{assets->get(j)}, field, errors)) {
                op.assets.push_back(*addr);
              }
            }
          } else {
            errors.push_back({prefix + ".assets", "required for this kind"});
          }
          break;
        case OperationKind::kSetEngine:
        case OperationKind::kTransferOwnership:
          require_address(*tbl, "target", prefix, op.target, errors);
          break;
        case OperationKind::kClearIfEmpty:
        case OperationKind::kAcceptOwnership:
          break;
      }
      result.operations.push_back(std::move(op));
    }
  }

  result.success = errors.empty();
  return result;
}

template <typename Result, typename Finish>
Result parse_file(const std::filesystem::path& path, Finish finish) {
  if (!std::filesystem::exists(path)) {
    Result result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    Result result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }
  return finish(parse_result.table());
}

template <typename Result, typename Finish>
Result parse_string(std::string_view toml_content, Finish finish) {
  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    Result result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }
  return finish(parse_result.table());
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  return parse_file<LoadResult>(path, finish_load);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return parse_string<LoadResult>(toml_content, finish_load);
}

BatchResult ConfigLoader::load_batch(const std::filesystem::path& path) {
  return parse_file<BatchResult>(path, finish_batch);
}

BatchResult ConfigLoader::load_batch_from_string(std::string_view toml_content) {
  return parse_string<BatchResult>(toml_content, finish_batch);
}

std::vector<ValidationError> ConfigLoader::validate(const NodeConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ledger.owner.is_null()) {
    errors.push_back({"ledger.owner", "owner must be set to a non-null address"});
  }

  if (config.ledger.consuming_engine && config.ledger.consuming_engine->is_null()) {
    errors.push_back({"ledger.consuming_engine", "cannot be the null address"});
  }

  if (config.sink.address.is_null()) {
    errors.push_back({"sink.address", "sink cannot be the null address"});
  }

  if (config.persistence.journal_path.empty()) {
    errors.push_back({"persistence.journal_path", "journal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.persistence.journal_flush_threshold == 0) {
    errors.push_back({"persistence.journal_flush_threshold", "must be greater than 0"});
  } else if (config.persistence.journal_flush_threshold > kMaxJournalFlushThreshold) {
    errors.push_back({"persistence.journal_flush_threshold", "must be at most 64 MiB"});
  }

  std::set<common::AssetId> seen;
  for (std::size_t i = 0; i < config.assets.size(); ++i) {
    const auto& asset = config.assets[i];
    const std::string prefix = "assets[" + std::to_string(i) + "]";

    if (asset.address.is_null()) {
      errors.push_back({prefix + ".address", "asset address cannot be null"});
    } else if (!seen.insert(asset.address).second) {
      errors.push_back({prefix + ".address", "duplicate asset " + asset.address.to_hex()});
    }

    if (asset.transfer_fee_bp > kMaxFeeBasisPoints) {
      errors.push_back({prefix + ".transfer_fee_bp", "must be between 0 and 10000"});
    }
  }

  for (std::size_t i = 0; i < config.genesis.size(); ++i) {
    const auto& allocation = config.genesis[i];
    const std::string prefix = "genesis[" + std::to_string(i) + "]";

    if (seen.find(allocation.asset) == seen.end()) {
      errors.push_back({prefix + ".asset", "asset is not configured"});
    }
    if (allocation.holder.is_null()) {
      errors.push_back({prefix + ".holder", "holder cannot be null"});
    }
    if (allocation.amount == 0) {
      errors.push_back({prefix + ".amount", "must be greater than 0"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# unitledger node configuration
# Generated default configuration

[ledger]
owner = "0x00000000000000000000000000000000000000a1"
# consuming_engine = "0x00000000000000000000000000000000000000e1"

[sink]
address = "0x000000000000000000000000000000000000dead"

[persistence]
journal_path = "/var/lib/unitledger/audit.journal"
snapshot_dir = "/var/lib/unitledger/snapshots"
journal_flush_threshold = 4096

[[assets]]
address = "0x0000000000000000000000000000000000000a55"
symbol = "UNIT"
listed = true
enabled = true
decimals = 18
units_per_reference_amount = 1
cap_units = 0        # 0 = uncapped
transfer_fee_bp = 0  # simulated asset book only
)";
}

}  // namespace config
}  // namespace unitledger
