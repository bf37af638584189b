#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/host/directory.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"

namespace lendcore {
namespace host {

namespace metrics {
constexpr telemetry::MetricId kAccepted = 1;
constexpr telemetry::MetricId kRejected = 2;
constexpr telemetry::MetricId kParseErrors = 3;
// Per-operation latency ids are kLatencyBase + registration index.
constexpr telemetry::MetricId kLatencyBase = 100;
}  // namespace metrics

using Arguments = std::vector<std::string>;

// What a handler produced: a transition result, a query value, or both empty.
struct Outcome {
  std::optional<ledger::TransitionResult> result{};
  std::optional<common::Amount> value{};
};

struct Invocation {
  std::size_t line{0};
  std::string text{};
  std::string operation{};
  common::AccountId caller{};
  std::optional<ledger::TransitionResult> result{};
  std::optional<common::Amount> value{};
  std::string parse_error{};

  [[nodiscard]] bool parsed() const noexcept { return parse_error.empty(); }
  [[nodiscard]] bool ok() const noexcept { return parsed() && (!result || result->ok()); }
};

using OperationHandler = std::function<Outcome(const common::AccountId& caller, const Arguments& args)>;

// Turns "<caller> <operation> [args...]" lines into ledger calls. Text after '#'
// is ignored.
class Dispatcher {
 public:
  Dispatcher(ledger::LedgerState& ledger,
             const Directory& directory,
             telemetry::TelemetrySink* telemetry = nullptr);

  // Throws std::invalid_argument on a duplicate name or an empty handler.
  void register_operation(std::string name, std::size_t arity, OperationHandler handler);
  [[nodiscard]] bool has_operation(const std::string& name) const;
  [[nodiscard]] const std::vector<std::string>& operations() const noexcept { return order_; }

  // std::nullopt for blank and comment-only lines. Malformed lines come back with
  // parse_error set; they never throw.
  [[nodiscard]] std::optional<Invocation> execute(std::string_view line, std::size_t line_number = 0);
  [[nodiscard]] std::vector<Invocation> run_script(std::istream& in);

  [[nodiscard]] std::string format(const Invocation& invocation) const;

 private:
  struct Operation {
    telemetry::MetricId metric{0};
    std::size_t arity{0};
    OperationHandler handler{};
  };

  ledger::LedgerState& ledger_;
  const Directory& directory_;
  telemetry::TelemetrySink* telemetry_;
  std::unordered_map<std::string, Operation> operations_{};
  std::vector<std::string> order_{};

  void register_builtin_operations();
  void record(const Operation& operation, const Invocation& invocation, std::chrono::nanoseconds elapsed);
  static common::Amount parse_amount(const std::string& text);
};

}  // namespace host
}  // namespace lendcore
