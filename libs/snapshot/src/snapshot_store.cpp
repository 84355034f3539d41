#include "unitledger/snapshot/snapshot_store.hpp"

#include <fstream>
#include <stdexcept>

namespace unitledger {
namespace snapshot {

namespace {
constexpr std::uint32_t kMagic = 0x4e534c55;  // 'ULSN'
constexpr std::uint16_t kVersion = 1;

struct SnapshotHeader {
  std::uint32_t magic{kMagic};
  std::uint16_t version{kVersion};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  std::uint64_t payload_size{0};
};

}  // namespace

Store::Store() = default;

Store::Store(std::filesystem::path directory) {
  prepare(directory);
}

void Store::prepare(const std::filesystem::path& directory) {
  if (!std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
  }
  directory_ = directory;
  file_path_ = directory_ / "ledger.snapshot";
}

void Store::persist(common::SequenceId sequence_id, std::span<const std::byte> payload) {
  if (directory_.empty()) {
    throw std::runtime_error("snapshot store directory not set");
  }

  auto tmp_path = file_path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open snapshot file for write: " + tmp_path.string());
    }

    SnapshotHeader header;
    header.sequence = sequence_id;
    header.payload_size = payload.size();
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    if (!payload.empty()) {
      out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    }
    out.flush();
    if (!out) {
      throw std::runtime_error("failed to write snapshot: " + tmp_path.string());
    }
  }
  std::filesystem::rename(tmp_path, file_path_);
}

std::optional<SnapshotRecord> Store::latest() const {
  if (file_path_.empty() || !std::filesystem::exists(file_path_)) {
    return std::nullopt;
  }

  std::ifstream in(file_path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open snapshot file for read: " + file_path_.string());
  }

  SnapshotHeader header;
  if (!in.read(reinterpret_cast<char*>(&header), sizeof(header))) {
    throw std::runtime_error("truncated snapshot header");
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid snapshot magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported snapshot version");
  }

  SnapshotRecord record;
  record.sequence = header.sequence;
  record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    in.read(reinterpret_cast<char*>(record.payload.data()), static_cast<std::streamsize>(header.payload_size));
    if (!in) {
      throw std::runtime_error("truncated snapshot record");
    }
  }
  return record;
}

}  // namespace snapshot
}  // namespace unitledger
