#pragma once

#include <limits>
#include <optional>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

[[nodiscard]] inline constexpr std::optional<Amount> checked_add(Amount lhs, Amount rhs) noexcept {
  if (rhs > std::numeric_limits<Amount>::max() - lhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

[[nodiscard]] inline constexpr std::optional<Amount> checked_sub(Amount lhs, Amount rhs) noexcept {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

[[nodiscard]] inline constexpr Amount saturating_sub(Amount lhs, Amount rhs) noexcept {
  return rhs > lhs ? 0 : lhs - rhs;
}

}  // namespace common
}  // namespace lendcore
