#include "lendcore/events/event_sink.hpp"

namespace lendcore {
namespace events {

void StreamSink::publish(const Event& event) {
  out_ << describe(event) << '\n';
}

void FanoutSink::attach(EventSink& sink) {
  sinks_.push_back(&sink);
}

void FanoutSink::publish(const Event& event) {
  for (auto* sink : sinks_) {
    sink->publish(event);
  }
}

}  // namespace events
}  // namespace lendcore
