#include "lendcore/host/dispatcher.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "lendcore/common/time_utils.hpp"

namespace lendcore {
namespace host {

namespace {

std::vector<std::string> tokenize(std::string_view line) {
  if (auto hash = line.find('#'); hash != std::string_view::npos) {
    line = line.substr(0, hash);
  }
  std::vector<std::string> tokens;
  std::istringstream iss{std::string(line)};
  std::string token;
  while (iss >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

}  // namespace

Dispatcher::Dispatcher(ledger::LedgerState& ledger,
                       const Directory& directory,
                       telemetry::TelemetrySink* telemetry)
    : ledger_(ledger), directory_(directory), telemetry_(telemetry) {
  register_builtin_operations();
}

void Dispatcher::register_operation(std::string name, std::size_t arity, OperationHandler handler) {
  if (!handler) {
    throw std::invalid_argument("operation '" + name + "' has no handler");
  }
  const auto metric = static_cast<telemetry::MetricId>(metrics::kLatencyBase + order_.size());
  auto [it, inserted] = operations_.try_emplace(name, Operation{.metric = metric, .arity = arity, .handler = {}});
  if (!inserted) {
    throw std::invalid_argument("operation already registered: " + name);
  }
  it->second.handler = std::move(handler);
  order_.push_back(std::move(name));
}

bool Dispatcher::has_operation(const std::string& name) const {
  return operations_.find(name) != operations_.end();
}

std::optional<Invocation> Dispatcher::execute(std::string_view line, std::size_t line_number) {
  const auto tokens = tokenize(line);
  if (tokens.empty()) {
    return std::nullopt;
  }

  Invocation invocation;
  invocation.line = line_number;
  invocation.text = std::string(line);

  if (tokens.size() < 2) {
    invocation.parse_error = "expected <caller> <operation> [args...]";
  } else {
    invocation.operation = tokens[1];
  }

  const auto it = invocation.parsed() ? operations_.find(invocation.operation) : operations_.end();
  if (invocation.parsed() && it == operations_.end()) {
    invocation.parse_error = "unknown operation '" + invocation.operation + "'";
  }
  if (invocation.parsed() && tokens.size() - 2 != it->second.arity) {
    invocation.parse_error = "'" + invocation.operation + "' takes " + std::to_string(it->second.arity) +
                             " argument(s), got " + std::to_string(tokens.size() - 2);
  }

  if (!invocation.parsed()) {
    if (telemetry_) {
      telemetry_->increment(metrics::kParseErrors);
    }
    return invocation;
  }

  try {
    invocation.caller = directory_.resolve(tokens[0]);
    const Arguments args(tokens.begin() + 2, tokens.end());

    const auto started = common::now_steady();
    auto outcome = it->second.handler(invocation.caller, args);
    const auto elapsed = common::now_steady() - started;

    invocation.result = outcome.result;
    invocation.value = outcome.value;
    record(it->second, invocation, elapsed);
  } catch (const std::invalid_argument& e) {
    invocation.parse_error = e.what();
    if (telemetry_) {
      telemetry_->increment(metrics::kParseErrors);
    }
  }

  return invocation;
}

std::vector<Invocation> Dispatcher::run_script(std::istream& in) {
  std::vector<Invocation> invocations;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (auto invocation = execute(line, line_number)) {
      invocations.push_back(std::move(*invocation));
    }
  }
  return invocations;
}

std::string Dispatcher::format(const Invocation& invocation) const {
  std::ostringstream oss;
  oss << "[" << invocation.line << "] ";
  if (!invocation.parsed()) {
    oss << "parse error: " << invocation.parse_error;
    return oss.str();
  }

  oss << directory_.label(invocation.caller) << " " << invocation.operation << " -> ";
  if (invocation.result) {
    if (invocation.result->ok()) {
      oss << "ok";
    } else {
      oss << "rejected " << ledger::to_string(*invocation.result->error) << " ("
          << invocation.result->reject_code << ")";
    }
  } else if (invocation.value) {
    oss << *invocation.value;
  }
  return oss.str();
}

void Dispatcher::record(const Operation& operation, const Invocation& invocation, std::chrono::nanoseconds elapsed) {
  if (!telemetry_) {
    return;
  }
  telemetry_->record_latency(operation.metric, elapsed);
  if (invocation.result) {
    telemetry_->increment(invocation.result->ok() ? metrics::kAccepted : metrics::kRejected);
  }
}

common::Amount Dispatcher::parse_amount(const std::string& text) {
  common::Amount value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    throw std::invalid_argument("invalid amount '" + text + "'");
  }
  return value;
}

void Dispatcher::register_builtin_operations() {
  auto* state = &ledger_;
  const auto* directory = &directory_;

  using AmountTransition = ledger::TransitionResult (ledger::LedgerState::*)(const common::AccountId&,
                                                                           common::Amount);
  using AccountQuery = common::Amount (ledger::LedgerState::*)(const common::AccountId&) const;

  auto amount_op = [state](AmountTransition fn) {
    return [state, fn](const common::AccountId& caller, const Arguments& args) {
      return Outcome{.result = (state->*fn)(caller, parse_amount(args[0]))};
    };
  };

  register_operation("deposit", 1, amount_op(&ledger::LedgerState::deposit));
  register_operation("withdraw", 1, amount_op(&ledger::LedgerState::withdraw));
  register_operation("add_collateral", 1, amount_op(&ledger::LedgerState::add_collateral));
  register_operation("remove_collateral", 1, amount_op(&ledger::LedgerState::remove_collateral));
  register_operation("borrow", 1, amount_op(&ledger::LedgerState::borrow));
  register_operation("repay", 1, amount_op(&ledger::LedgerState::repay));

  register_operation("liquidate", 2, [state, directory](const common::AccountId& caller, const Arguments& args) {
    return Outcome{.result = state->liquidate(caller, directory->resolve(args[0]), parse_amount(args[1]))};
  });
  register_operation("accrue_interest", 0, [state](const common::AccountId& caller, const Arguments&) {
    return Outcome{.result = state->accrue_interest(caller)};
  });

  register_operation("set_interest_rate_model", 1,
                     [state, directory](const common::AccountId& caller, const Arguments& args) {
                       return Outcome{.result = state->set_interest_rate_model(caller, directory->resolve(args[0]))};
                     });
  register_operation("reinitialize", 2, [state, directory](const common::AccountId& caller, const Arguments& args) {
    return Outcome{.result = state->reinitialize(caller, directory->resolve(args[0]), directory->resolve(args[1]))};
  });
  register_operation("pause", 0, [state](const common::AccountId& caller, const Arguments&) {
    return Outcome{.result = state->pause(caller)};
  });
  register_operation("unpause", 0, [state](const common::AccountId& caller, const Arguments&) {
    return Outcome{.result = state->unpause(caller)};
  });

  auto account_query = [state, directory](AccountQuery fn) {
    return [state, directory, fn](const common::AccountId&, const Arguments& args) {
      return Outcome{.value = (state->*fn)(directory->resolve(args[0]))};
    };
  };

  register_operation("liquidity", 1, account_query(&ledger::LedgerState::get_account_liquidity));
  register_operation("shortfall", 1, account_query(&ledger::LedgerState::get_account_shortfall));
  register_operation("balance", 1, account_query(&ledger::LedgerState::balance_of));
  register_operation("debt", 1, account_query(&ledger::LedgerState::debt_of));
  register_operation("collateral", 1, account_query(&ledger::LedgerState::collateral_of));
  register_operation("total_supply", 0, [state](const common::AccountId&, const Arguments&) {
    return Outcome{.value = state->get_total_supply()};
  });
  register_operation("total_borrow", 0, [state](const common::AccountId&, const Arguments&) {
    return Outcome{.value = state->get_total_borrow()};
  });
}

}  // namespace host
}  // namespace lendcore
