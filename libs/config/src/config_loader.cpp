#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>
#include <unordered_set>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

LedgerConfig parse_ledger(const toml::table& root) {
  LedgerConfig cfg;
  if (auto* ledger = root["ledger"].as_table()) {
    cfg.admin = get_str_or(*ledger, "admin", cfg.admin);
    cfg.interest_rate_model = get_str_or(*ledger, "interest_rate_model", cfg.interest_rate_model);
    cfg.underlying_asset = get_str_or(*ledger, "underlying_asset", cfg.underlying_asset);
  }
  return cfg;
}

JournalConfig parse_journal(const toml::table& root) {
  JournalConfig cfg;
  if (auto* journal = root["journal"].as_table()) {
    cfg.echo = get_bool_or(*journal, "echo", cfg.echo);
    const auto capacity = get_int_or(*journal, "capacity", static_cast<std::int64_t>(cfg.capacity));
    cfg.capacity = capacity < 0 ? 0 : static_cast<std::size_t>(capacity);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

std::vector<AccountConfig> parse_accounts(const toml::table& root) {
  std::vector<AccountConfig> accounts;
  if (auto* arr = root["accounts"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* account_tbl = elem.as_table()) {
        AccountConfig account;
        account.name = get_str_or(*account_tbl, "name", "");
        account.id = get_str_or(*account_tbl, "id", "");
        accounts.push_back(std::move(account));
      }
    }
  }
  return accounts;
}

HostConfig parse_config(const toml::table& root) {
  HostConfig cfg;
  cfg.ledger = parse_ledger(root);
  cfg.journal = parse_journal(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.accounts = parse_accounts(root);
  return cfg;
}

LoadResult finish(const toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  return finish(toml::parse_file(path.string()));
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  return finish(toml::parse(toml_content));
}

std::vector<ValidationError> ConfigLoader::validate(const HostConfig& config) {
  std::vector<ValidationError> errors;
  std::unordered_set<std::string> names;

  for (std::size_t i = 0; i < config.accounts.size(); ++i) {
    const auto& account = config.accounts[i];
    const std::string prefix = "accounts[" + std::to_string(i) + "]";

    if (account.name.empty()) {
      errors.push_back({prefix + ".name", "name cannot be empty"});
    } else if (!names.insert(account.name).second) {
      errors.push_back({prefix + ".name", "duplicate account name '" + account.name + "'"});
    }

    if (!common::AccountId::from_hex(account.id)) {
      errors.push_back({prefix + ".id", "id must be 64 hex characters"});
    }
  }

  auto check_reference = [&](const std::string& field, const std::string& value) {
    if (value.empty()) {
      errors.push_back({field, "account reference cannot be empty"});
      return;
    }
    if (names.count(value) == 0 && !common::AccountId::from_hex(value)) {
      errors.push_back({field, "'" + value + "' is neither a known account name nor a 64-hex id"});
    }
  };

  check_reference("ledger.admin", config.ledger.admin);
  check_reference("ledger.interest_rate_model", config.ledger.interest_rate_model);
  check_reference("ledger.underlying_asset", config.ledger.underlying_asset);

  if (config.journal.capacity > kMaxJournalCapacity) {
    errors.push_back({"journal.capacity", "capacity must be at most " + std::to_string(kMaxJournalCapacity)});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore host configuration
# Generated default configuration

[ledger]
admin = "admin"
interest_rate_model = "rate-model"
underlying_asset = "asset"

[journal]
echo = true
capacity = 1024

[telemetry]
enabled = true

[[accounts]]
name = "admin"
id = "0000000000000000000000000000000000000000000000000000000000000001"

[[accounts]]
name = "alice"
id = "000000000000000000000000000000000000000000000000000000000000000a"

[[accounts]]
name = "bob"
id = "000000000000000000000000000000000000000000000000000000000000000b"

[[accounts]]
name = "carol"
id = "000000000000000000000000000000000000000000000000000000000000000c"

[[accounts]]
name = "rate-model"
id = "0000000000000000000000000000000000000000000000000000000000000010"

[[accounts]]
name = "asset"
id = "0000000000000000000000000000000000000000000000000000000000000011"
)";
}

}  // namespace config
}  // namespace lendcore
