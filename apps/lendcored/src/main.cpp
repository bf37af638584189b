#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "lendcore/config/config_loader.hpp"
#include "lendcore/digest/state_digest.hpp"
#include "lendcore/events/event_sink.hpp"
#include "lendcore/events/journal.hpp"
#include "lendcore/host/directory.hpp"
#include "lendcore/host/dispatcher.hpp"
#include "lendcore/ledger/ledger_state.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [script_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n"
            << "  script_file: One '<caller> <operation> [args...]' per line; '-' or absent reads stdin\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      home ? std::filesystem::path{home} / ".config/lendcore/lendcore.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::HostConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  host::Directory directory;
  common::AccountId admin;
  common::AccountId rate_model;
  common::AccountId asset;
  try {
    directory = host::Directory::from_config(cfg.accounts);
    admin = directory.resolve(cfg.ledger.admin);
    rate_model = directory.resolve(cfg.ledger.interest_rate_model);
    asset = directory.resolve(cfg.ledger.underlying_asset);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Config error: " << e.what() << "\n";
    return 1;
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Accounts: " << directory.size() << "\n";
  std::cout << "  Admin: " << directory.label(admin) << "\n";

  events::Journal journal{cfg.journal.capacity};
  events::StreamSink echo{std::cout};
  events::FanoutSink sinks;
  sinks.attach(journal);
  if (cfg.journal.echo) {
    sinks.attach(echo);
  }

  ledger::LedgerState ledger{rate_model, asset, admin, sinks};

  telemetry::TelemetrySink telemetry;
  host::Dispatcher dispatcher{ledger, directory, cfg.telemetry.enabled ? &telemetry : nullptr};

  std::ifstream script_file;
  const bool from_stdin = argc < 3 || std::string_view{argv[2]} == "-";
  if (!from_stdin) {
    script_file.open(argv[2]);
    if (!script_file) {
      std::cerr << "Failed to open script: " << argv[2] << "\n";
      return 1;
    }
  }
  std::istream& script = from_stdin ? std::cin : script_file;

  // Invocations are reported as they run and the journal is drained per line,
  // so memory stays flat however long the script is.
  std::size_t processed = 0;
  std::size_t parse_errors = 0;
  std::size_t notifications = journal.drain().size();
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(script, line)) {
    ++line_number;
    const auto invocation = dispatcher.execute(line, line_number);
    notifications += journal.drain().size();
    if (!invocation) {
      continue;
    }
    ++processed;
    if (!invocation->parsed()) {
      ++parse_errors;
      std::cerr << dispatcher.format(*invocation) << "\n";
      continue;
    }
    std::cout << dispatcher.format(*invocation) << "\n";
  }

  std::cout << "Processed " << processed << " invocations, " << notifications << " notifications\n";
  std::cout << "  Total supply: " << ledger.get_total_supply() << "\n";
  std::cout << "  Total borrow: " << ledger.get_total_borrow() << "\n";
  std::cout << "  Paused: " << (ledger.paused() ? "yes" : "no") << "\n";
  std::cout << "  State digest: " << digest::to_hex(digest::state_digest(ledger)) << "\n";

  if (cfg.telemetry.enabled) {
    std::cout << "  Accepted: " << telemetry.counter(host::metrics::kAccepted)
              << ", rejected: " << telemetry.counter(host::metrics::kRejected) << "\n";
    const auto& names = dispatcher.operations();
    for (const auto& summary : telemetry.drain_latency()) {
      const auto index = summary.metric - host::metrics::kLatencyBase;
      std::cout << "  " << (index < names.size() ? names[index] : "?") << ": count=" << summary.count
                << " mean_ns=" << summary.mean_ns << " p99_ns=" << summary.p99_ns << "\n";
    }
  }

  return parse_errors == 0 ? 0 : 2;
}
