#pragma once

#include <ostream>
#include <vector>

#include "lendcore/events/events.hpp"

namespace lendcore {
namespace events {

// Receives every notification the ledger emits. Publication is fire-and-forget:
// the ledger never waits on or inspects the outcome.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const Event& event) = 0;
};

class NullSink final : public EventSink {
 public:
  void publish(const Event&) override {}
};

// Writes one described line per notification.
class StreamSink final : public EventSink {
 public:
  explicit StreamSink(std::ostream& out) : out_(out) {}

  void publish(const Event& event) override;

 private:
  std::ostream& out_;
};

// Forwards each notification to every attached sink, in attach order.
class FanoutSink final : public EventSink {
 public:
  void attach(EventSink& sink);
  void publish(const Event& event) override;
  [[nodiscard]] std::size_t size() const noexcept { return sinks_.size(); }

 private:
  std::vector<EventSink*> sinks_{};
};

}  // namespace events
}  // namespace lendcore
