#include "lendcore/host/directory.hpp"

#include <stdexcept>
#include <utility>

namespace lendcore {
namespace host {

void Directory::add(std::string name, const common::AccountId& id) {
  if (name.empty()) {
    throw std::invalid_argument("account name cannot be empty");
  }
  if (by_name_.count(name) != 0) {
    throw std::invalid_argument("duplicate account name '" + name + "'");
  }
  by_id_.try_emplace(id, name);
  by_name_.emplace(std::move(name), id);
}

common::AccountId Directory::resolve(std::string_view text) const {
  if (auto id = find(text)) {
    return *id;
  }
  if (auto id = common::AccountId::from_hex(text)) {
    return *id;
  }
  throw std::invalid_argument("unknown account '" + std::string(text) + "'");
}

std::optional<common::AccountId> Directory::find(std::string_view name) const {
  if (auto it = by_name_.find(std::string(name)); it != by_name_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string Directory::label(const common::AccountId& id) const {
  if (auto it = by_id_.find(id); it != by_id_.end()) {
    return it->second;
  }
  return id.to_hex();
}

Directory Directory::from_config(const std::vector<config::AccountConfig>& accounts) {
  Directory directory;
  for (const auto& account : accounts) {
    auto id = common::AccountId::from_hex(account.id);
    if (!id) {
      throw std::invalid_argument("account '" + account.name + "' has a malformed id");
    }
    directory.add(account.name, *id);
  }
  return directory;
}

}  // namespace host
}  // namespace lendcore
