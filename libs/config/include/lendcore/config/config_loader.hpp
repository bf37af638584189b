#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lendcore {
namespace config {

// Account references below are either a name from [[accounts]] or 64 hex chars.
struct LedgerConfig {
  std::string admin{"admin"};
  std::string interest_rate_model{"rate-model"};
  std::string underlying_asset{"asset"};
};

struct AccountConfig {
  std::string name;
  std::string id;
};

// Upper bound on the journal reserve hint.
constexpr std::size_t kMaxJournalCapacity = std::size_t{1} << 20;

struct JournalConfig {
  bool echo{true};
  std::size_t capacity{1024};
};

struct TelemetryConfig {
  bool enabled{true};
};

struct HostConfig {
  LedgerConfig ledger;
  JournalConfig journal;
  TelemetryConfig telemetry;
  std::vector<AccountConfig> accounts;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  HostConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const HostConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
