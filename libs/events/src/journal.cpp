#include "lendcore/events/journal.hpp"

#include <utility>

namespace lendcore {
namespace events {

Journal::Journal(std::size_t capacity_hint) {
  buffer_.reserve(capacity_hint);
}

void Journal::publish(const Event& event) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(JournalEntry{.sequence = next_sequence_++, .event = event});
}

std::vector<JournalEntry> Journal::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::vector<JournalEntry> Journal::entries() const {
  std::scoped_lock lock(mutex_);
  return buffer_;
}

std::size_t Journal::size() const {
  std::scoped_lock lock(mutex_);
  return buffer_.size();
}

common::SequenceId Journal::next_sequence() const {
  std::scoped_lock lock(mutex_);
  return next_sequence_;
}

}  // namespace events
}  // namespace lendcore
