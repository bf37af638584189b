#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lendcore {
namespace ledger {

enum class Error : std::uint8_t {
  kNotAuthorized,
  kInsufficientBalance,
  // Reserved for protocol-wide liquidity shortfalls. No transition raises it.
  kInsufficientLiquidity,
  kInsufficientCollateral,
  kContractPaused,
  kArithmeticOverflow,
};

[[nodiscard]] std::string_view to_string(Error error) noexcept;
[[nodiscard]] std::uint16_t reject_code(Error error) noexcept;

struct TransitionResult {
  std::optional<Error> error{};
  std::uint16_t reject_code{0};

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  static TransitionResult accepted() noexcept { return {}; }
  static TransitionResult rejected(Error e) noexcept {
    return TransitionResult{.error = e, .reject_code = ledger::reject_code(e)};
  }
};

}  // namespace ledger
}  // namespace lendcore
