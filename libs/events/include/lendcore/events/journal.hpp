#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_sink.hpp"

namespace lendcore {
namespace events {

struct JournalEntry {
  common::SequenceId sequence{0};
  Event event{};
};

// In-memory notification sink. Sequence numbers start at 1 and keep counting
// across drains.
class Journal final : public EventSink {
 public:
  explicit Journal(std::size_t capacity_hint = 0);

  void publish(const Event& event) override;

  [[nodiscard]] std::vector<JournalEntry> drain();
  [[nodiscard]] std::vector<JournalEntry> entries() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] common::SequenceId next_sequence() const;

 private:
  mutable std::mutex mutex_;
  std::vector<JournalEntry> buffer_{};
  common::SequenceId next_sequence_{1};
};

}  // namespace events
}  // namespace lendcore
