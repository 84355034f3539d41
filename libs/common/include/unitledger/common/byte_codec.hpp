#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace common {
namespace codec {

// Every encoded integer is little-endian regardless of the host.
template <std::size_t N>
inline std::array<std::byte, N> to_wire_order(std::array<std::byte, N> raw) noexcept {
  if constexpr (std::endian::native == std::endian::big) {
    std::reverse(raw.begin(), raw.end());
  }
  return raw;
}

template <typename T>
inline void append_primitive(std::vector<std::byte>& buffer, T value) {
  const auto raw = to_wire_order(std::bit_cast<std::array<std::byte, sizeof(T)>>(value));
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
inline T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(to_wire_order(storage));
}

inline void append_address(std::vector<std::byte>& buffer, const Address& addr) {
  const auto raw = std::as_bytes(std::span(addr.bytes));
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

inline Address read_address(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + kAddressSize > data.size()) {
    throw std::runtime_error("decode out of bounds");
  }
  Address addr;
  for (std::size_t i = 0; i < kAddressSize; ++i) {
    addr.bytes[i] = std::to_integer<std::uint8_t>(data[offset + i]);
  }
  offset += kAddressSize;
  return addr;
}

}  // namespace codec
}  // namespace common
}  // namespace unitledger
