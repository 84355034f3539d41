#pragma once

#include <chrono>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace common {

inline TimestampNs now_wall_ns() noexcept {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace common
}  // namespace unitledger
