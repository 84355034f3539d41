#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>
#include <utility>

#include "unitledger/config/config_loader.hpp"
#include "unitledger/ledger/ledger_core.hpp"
#include "unitledger/node/ledger_node.hpp"

namespace {

struct Options {
  std::filesystem::path config_path;
  std::filesystem::path batch_path;
  bool write_snapshot{false};
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [--snapshot] [config_file] [batch_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./unitledger.toml or generates defaults\n"
            << "  batch_file:  TOML file of [[ops]] to apply after recovery\n"
            << "  --snapshot:  Persist a snapshot of the ledger before exiting\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
  Options options;
  int positional = 0;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--snapshot") {
      options.write_snapshot = true;
    } else if (arg == "-h" || arg == "--help" || arg.starts_with("--")) {
      return std::nullopt;
    } else if (positional == 0) {
      options.config_path = argv[i];
      ++positional;
    } else if (positional == 1) {
      options.batch_path = argv[i];
      ++positional;
    } else {
      return std::nullopt;
    }
  }
  return options;
}

std::filesystem::path find_config_path(const Options& options) {
  if (!options.config_path.empty()) {
    return options.config_path;
  }

  std::filesystem::path default_paths[] = {
      "./unitledger.toml",
      "/etc/unitledger/unitledger.toml",
      std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""} / ".config/unitledger/unitledger.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::string_view status_text(unitledger::ledger::Status status) {
  return unitledger::ledger::to_string(status);
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace unitledger;

  const auto options = parse_args(argc, argv);
  if (!options) {
    print_usage(argv[0]);
    return 2;
  }

  auto config_path = find_config_path(*options);
  config::NodeConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Owner: " << cfg.ledger.owner.to_hex() << "\n";
  std::cout << "  Sink: " << cfg.sink.address.to_hex() << "\n";
  std::cout << "  Assets: " << cfg.assets.size() << "\n";
  std::cout << "  Journal path: " << cfg.persistence.journal_path << "\n";

  std::optional<node::LedgerNode> ledger_node;
  common::SequenceId recovered_sequence = 0;
  try {
    ledger_node.emplace(cfg);
    recovered_sequence = ledger_node->recover();
  } catch (const std::exception& e) {
    std::cerr << "Recovery failed: " << e.what() << "\n";
    return 1;
  }
  const auto& store = ledger_node->store();
  std::cout << "Recovered ledger at sequence " << recovered_sequence << " (" << ledger_node->records_replayed()
            << " journal records replayed, " << store.beneficiaries().size() << " beneficiaries)\n";
  std::cout << "  Owner: " << ledger_node->ownership().owner().to_hex() << "\n";
  if (const auto& engine = store.consuming_engine()) {
    std::cout << "  Consuming engine: " << engine->to_hex() << "\n";
  }

  if (!options->batch_path.empty()) {
    auto batch = config::ConfigLoader::load_batch(options->batch_path);
    if (!batch.success) {
      if (!batch.raw_error.empty()) {
        std::cerr << "Batch parse error: " << batch.raw_error << "\n";
      }
      for (const auto& err : batch.errors) {
        std::cerr << "Batch error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }

    std::size_t applied = 0;
    try {
      for (std::size_t i = 0; i < batch.operations.size(); ++i) {
        const auto status = ledger_node->apply(batch.operations[i]);
        if (status == ledger::Status::kOk) {
          ++applied;
        } else {
          std::cout << "  ops[" << i << "] rejected: " << status_text(status) << "\n";
        }
      }
    } catch (const std::exception& e) {
      std::cerr << "Batch aborted after " << applied << " operations: " << e.what() << "\n";
      return 1;
    }
    std::cout << "Applied " << applied << " of " << batch.operations.size() << " operations\n";
  }

  try {
    if (options->write_snapshot) {
      std::cout << "Snapshot written at sequence " << ledger_node->persist_snapshot() << "\n";
    } else {
      ledger_node->sync();
    }
  } catch (const std::exception& e) {
    std::cerr << "Persisting ledger failed: " << e.what() << "\n";
    return 1;
  }

  for (const auto& asset_cfg : cfg.assets) {
    std::cout << "  " << asset_cfg.symbol << " cumulative sponsored: "
              << store.cumulative_sponsored(asset_cfg.address) << "\n";
  }
  std::cout << "  Sink " << cfg.sink.address.to_hex() << " holds:";
  for (const auto& asset_cfg : cfg.assets) {
    std::cout << " " << ledger_node->book().balance_of(asset_cfg.address, cfg.sink.address) << " "
              << asset_cfg.symbol;
  }
  std::cout << "\n";
  std::cout << "unitledgerd finished at journal sequence " << ledger_node->journal_sequence() << "\n";
  return 0;
}
