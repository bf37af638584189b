#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lendcore {
namespace common {

using Amount = std::uint64_t;
using SequenceId = std::uint64_t;

constexpr std::size_t kAccountIdSize = 32;

// Opaque caller identity supplied by the host. The ledger only compares and hashes it.
struct AccountId {
  std::array<std::uint8_t, kAccountIdSize> bytes{};

  [[nodiscard]] bool is_zero() const noexcept;
  [[nodiscard]] std::string to_hex() const;

  // Accepts exactly 64 hex characters.
  [[nodiscard]] static std::optional<AccountId> from_hex(std::string_view hex);

  friend bool operator==(const AccountId&, const AccountId&) = default;
  friend auto operator<=>(const AccountId&, const AccountId&) = default;
};

// Big-endian value in the trailing 8 bytes, so ids built this way sort by value.
inline AccountId make_account_id(std::uint64_t value) noexcept {
  AccountId id;
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    id.bytes[kAccountIdSize - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
  return id;
}

struct AccountIdHash {
  std::size_t operator()(const AccountId& id) const noexcept {
    constexpr std::uint64_t kFnvPrime = 1099511628211ull;
    std::uint64_t hash = 14695981039346656037ull;
    for (const auto b : id.bytes) {
      hash ^= b;
      hash *= kFnvPrime;
    }
    return static_cast<std::size_t>(hash);
  }
};

}  // namespace common
}  // namespace lendcore
