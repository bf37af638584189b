#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "lendcore/ledger/ledger_state.hpp"

namespace lendcore {
namespace digest {

constexpr std::size_t kDigestSize = 32;

using Digest = std::array<std::uint8_t, kDigestSize>;

// BLAKE2b-256 over the canonical ledger state:
//   tag, admin, interest_rate_model, underlying_asset, paused, total_supply,
//   total_borrow, then balances, debts and collaterals each as
//   [count:u64][(id:32, amount:u64) ascending by id].
// Integers are little-endian. Ledgers with equal observable state hash equal.
[[nodiscard]] Digest state_digest(const ledger::LedgerState& ledger);

[[nodiscard]] std::string to_hex(const Digest& digest);

}  // namespace digest
}  // namespace lendcore
