#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/config/config_loader.hpp"

namespace lendcore {
namespace host {

// Identity provider for the reference host: human names for account ids.
class Directory {
 public:
  // Throws std::invalid_argument on an empty or duplicate name.
  void add(std::string name, const common::AccountId& id);

  // Accepts a registered name or 64 hex chars. Throws std::invalid_argument otherwise.
  [[nodiscard]] common::AccountId resolve(std::string_view text) const;

  [[nodiscard]] std::optional<common::AccountId> find(std::string_view name) const;

  // Registered name for `id`, or its hex form.
  [[nodiscard]] std::string label(const common::AccountId& id) const;

  [[nodiscard]] std::size_t size() const noexcept { return by_name_.size(); }

  // Throws std::invalid_argument on malformed entries.
  static Directory from_config(const std::vector<config::AccountConfig>& accounts);

 private:
  std::unordered_map<std::string, common::AccountId> by_name_{};
  std::unordered_map<common::AccountId, std::string, common::AccountIdHash> by_id_{};
};

}  // namespace host
}  // namespace lendcore
