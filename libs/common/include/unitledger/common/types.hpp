#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace unitledger {
namespace common {

using Units = std::uint64_t;
using SequenceId = std::uint64_t;
using TimestampNs = std::int64_t;

inline constexpr std::size_t kAddressSize = 20;

struct Address {
  std::array<std::uint8_t, kAddressSize> bytes{};

  [[nodiscard]] bool is_null() const noexcept {
    return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
  }

  // Places the id big-endian in the low 8 bytes. Handy for fixtures and small deployments.
  [[nodiscard]] static Address from_id(std::uint64_t id) noexcept {
    Address addr;
    for (std::size_t i = 0; i < 8; ++i) {
      addr.bytes[kAddressSize - 1 - i] = static_cast<std::uint8_t>(id >> (8 * i));
    }
    return addr;
  }

  [[nodiscard]] std::string to_hex() const {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + kAddressSize * 2);
    for (const auto b : bytes) {
      out.push_back(kDigits[b >> 4]);
      out.push_back(kDigits[b & 0x0f]);
    }
    return out;
  }

  // Accepts 40 hex digits with an optional 0x prefix.
  [[nodiscard]] static std::optional<Address> from_hex(std::string_view text) noexcept {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
      text.remove_prefix(2);
    }
    if (text.size() != kAddressSize * 2) {
      return std::nullopt;
    }
    auto nibble = [](char c) -> int {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    };
    Address addr;
    for (std::size_t i = 0; i < kAddressSize; ++i) {
      const int hi = nibble(text[2 * i]);
      const int lo = nibble(text[2 * i + 1]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      addr.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return addr;
  }

  friend bool operator==(const Address&, const Address&) = default;
  friend auto operator<=>(const Address&, const Address&) = default;
};

using AssetId = Address;

struct AddressHash {
  std::size_t operator()(const Address& addr) const noexcept {
    std::uint64_t hash = 14695981039346656037ull;
    for (const auto b : addr.bytes) {
      hash ^= b;
      hash *= 1099511628211ull;
    }
    return static_cast<std::size_t>(hash);
  }
};

}  // namespace common
}  // namespace unitledger
