#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "unitledger/audit/events.hpp"

namespace unitledger {
namespace audit {

// Layout: [kind:1][fields...], integers little-endian, addresses as 20 raw bytes.
std::vector<std::byte> encode(const Event& event);

// Throws std::runtime_error on unknown kinds, short buffers or trailing bytes.
Event decode(std::span<const std::byte> data);

}  // namespace audit
}  // namespace unitledger
