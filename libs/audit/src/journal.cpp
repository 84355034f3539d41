#include "unitledger/audit/journal.hpp"

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace unitledger {
namespace journal {

namespace {
constexpr std::uint32_t kMagic = 0x4e4a4c55;  // 'ULJN'
constexpr std::uint16_t kVersion = 1;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

void fsync_file(std::FILE* file) {
#if defined(_WIN32)
  const int fd = _fileno(file);
  if (::FlushFileBuffers(reinterpret_cast<HANDLE>(_get_osfhandle(fd))) == 0) {
    throw std::system_error(static_cast<int>(GetLastError()), std::system_category(), "FlushFileBuffers failed");
  }
#else
  if (::fsync(fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "fsync failed");
  }
#endif
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_bytes)
    : buffer_(), flush_threshold_(flush_threshold_bytes) {
  buffer_.reserve(flush_threshold_bytes);
  open(path);
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception& e) {
    std::cerr << "journal: flush on close failed: " << e.what() << "\n";
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::open(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    Reader reader(path);
    Record record;
    while (reader.next(record)) {
      next_sequence_ = record.header.sequence + 1;
    }
  }
  file_ = std::fopen(path.c_str(), "ab");
  if (!file_) {
    throw std::runtime_error("failed to open journal: " + path.string());
  }
}

common::SequenceId Writer::append(std::span<const std::byte> payload, common::TimestampNs timestamp_ns) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }

  RecordHeader header;
  header.magic = kMagic;
  header.version = kVersion;
  header.sequence = next_sequence_++;
  header.timestamp_ns = timestamp_ns;
  header.payload_size = static_cast<std::uint32_t>(payload.size());
  header.checksum = checksum32(payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), payload.begin(), payload.end());

  if (buffer_.size() >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write journal buffer");
  }
  buffer_.clear();
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "journal fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (file_) {
    fsync_file(file_);
  }
}

Reader::Reader(const std::filesystem::path& path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  RecordHeader header;
  const auto read_header = std::fread(&header, 1, sizeof(RecordHeader), file_);
  if (read_header == 0) {
    return false;
  }
  if (read_header != sizeof(RecordHeader)) {
    throw std::runtime_error("truncated journal header");
  }
  if (header.magic != kMagic) {
    throw std::runtime_error("invalid journal magic");
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported journal version");
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated journal record");
    }
  }
  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch");
  }
  return true;
}

}  // namespace journal
}  // namespace unitledger
