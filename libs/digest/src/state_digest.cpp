#include "lendcore/digest/state_digest.hpp"

#include <sodium.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "lendcore/common/sodium_init.hpp"

namespace lendcore {
namespace digest {

namespace {

constexpr std::string_view kDomainTag = "lendcore.ledger.v1";

class Hasher {
 public:
  Hasher() {
    if (crypto_generichash_init(&state_, nullptr, 0, kDigestSize) != 0) {
      throw std::runtime_error("crypto_generichash_init failed");
    }
  }

  void bytes(const std::uint8_t* data, std::size_t size) {
    if (crypto_generichash_update(&state_, data, size) != 0) {
      throw std::runtime_error("crypto_generichash_update failed");
    }
  }

  void u64(std::uint64_t value) {
    std::array<std::uint8_t, sizeof(value)> le{};
    for (std::size_t i = 0; i < le.size(); ++i) {
      le[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    bytes(le.data(), le.size());
  }

  void account(const common::AccountId& id) { bytes(id.bytes.data(), id.bytes.size()); }

  void book(const ledger::Book& entries) {
    std::vector<std::pair<common::AccountId, common::Amount>> sorted(entries.begin(), entries.end());
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    u64(sorted.size());
    for (const auto& [id, amount] : sorted) {
      account(id);
      u64(amount);
    }
  }

  Digest finish() {
    Digest out{};
    if (crypto_generichash_final(&state_, out.data(), out.size()) != 0) {
      throw std::runtime_error("crypto_generichash_final failed");
    }
    return out;
  }

 private:
  crypto_generichash_state state_{};
};

}  // namespace

Digest state_digest(const ledger::LedgerState& ledger) {
  common::ensure_sodium_init();

  Hasher hasher;
  hasher.bytes(reinterpret_cast<const std::uint8_t*>(kDomainTag.data()), kDomainTag.size());
  hasher.account(ledger.admin());
  hasher.account(ledger.interest_rate_model());
  hasher.account(ledger.underlying_asset());
  const std::uint8_t paused = ledger.paused() ? 1 : 0;
  hasher.bytes(&paused, 1);
  hasher.u64(ledger.get_total_supply());
  hasher.u64(ledger.get_total_borrow());
  hasher.book(ledger.balances());
  hasher.book(ledger.debts());
  hasher.book(ledger.collaterals());
  return hasher.finish();
}

std::string to_hex(const Digest& digest) {
  common::ensure_sodium_init();
  std::string out(kDigestSize * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), digest.data(), digest.size());
  out.resize(kDigestSize * 2);
  return out;
}

}  // namespace digest
}  // namespace lendcore
