#pragma once

#include <vector>

#include "unitledger/audit/events.hpp"
#include "unitledger/audit/journal.hpp"

namespace unitledger {
namespace audit {

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const Event& event) = 0;
};

class MemoryLog final : public EventSink {
 public:
  void publish(const Event& event) override;

  [[nodiscard]] const std::vector<Event>& events() const noexcept { return events_; }
  [[nodiscard]] std::vector<Event> drain();

  template <typename T>
  [[nodiscard]] std::vector<T> of_type() const {
    std::vector<T> out;
    for (const auto& event : events_) {
      if (const auto* e = std::get_if<T>(&event)) {
        out.push_back(*e);
      }
    }
    return out;
  }

 private:
  std::vector<Event> events_{};
};

// Encodes each record into the journal, stamped with wall-clock time.
class JournalSink final : public EventSink {
 public:
  explicit JournalSink(journal::Writer& writer) : writer_(writer) {}

  void publish(const Event& event) override;

 private:
  journal::Writer& writer_;
};

}  // namespace audit
}  // namespace unitledger
