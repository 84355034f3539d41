#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace journal {

struct RecordHeader {
  std::uint32_t magic{0x4e4a4c55};  // 'ULJN'
  std::uint16_t version{1};
  std::uint16_t reserved{0};
  common::SequenceId sequence{0};
  common::TimestampNs timestamp_ns{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only audit journal. Sequences start at 1 and continue across reopen.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path,
                  std::size_t flush_threshold_bytes = 1 << 12);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  common::SequenceId append(std::span<const std::byte> payload, common::TimestampNs timestamp_ns);
  void flush();
  void sync();
  [[nodiscard]] common::SequenceId next_sequence() const noexcept { return next_sequence_; }
  [[nodiscard]] common::SequenceId last_sequence() const noexcept { return next_sequence_ - 1; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t flush_threshold_;
  common::SequenceId next_sequence_{1};

  void open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  bool next(Record& out_record);

 private:
  std::FILE* file_{nullptr};
};

}  // namespace journal
}  // namespace unitledger
