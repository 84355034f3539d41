#include "unitledger/audit/event_sink.hpp"

#include <utility>

#include "unitledger/audit/event_codec.hpp"
#include "unitledger/common/time_utils.hpp"

namespace unitledger {
namespace audit {

void MemoryLog::publish(const Event& event) {
  events_.push_back(event);
}

std::vector<Event> MemoryLog::drain() {
  auto copy = std::move(events_);
  events_.clear();
  return copy;
}

void JournalSink::publish(const Event& event) {
  const auto payload = encode(event);
  writer_.append(payload, common::now_wall_ns());
}

}  // namespace audit
}  // namespace unitledger
