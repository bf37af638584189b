#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace events {

struct Initialized {
  common::AccountId interest_rate_model{};
  common::AccountId underlying_asset{};
};

struct Deposit {
  common::AccountId from{};
  common::Amount amount{0};
};

struct Withdraw {
  common::AccountId to{};
  common::Amount amount{0};
};

struct Borrow {
  common::AccountId borrower{};
  common::Amount amount{0};
};

struct Repay {
  common::AccountId borrower{};
  common::Amount amount{0};
};

struct Liquidate {
  common::AccountId liquidator{};
  common::AccountId borrower{};
  common::Amount amount{0};
};

struct InterestAccrued {
  common::Amount amount{0};
};

struct InterestRateModelUpdated {
  common::AccountId new_model{};
};

struct CollateralAdded {
  common::AccountId user{};
  common::Amount amount{0};
};

struct CollateralRemoved {
  common::AccountId user{};
  common::Amount amount{0};
};

struct ContractPaused {};

struct ContractUnpaused {};

using Event = std::variant<Initialized,
                           Deposit,
                           Withdraw,
                           Borrow,
                           Repay,
                           Liquidate,
                           InterestAccrued,
                           InterestRateModelUpdated,
                           CollateralAdded,
                           CollateralRemoved,
                           ContractPaused,
                           ContractUnpaused>;

[[nodiscard]] std::string_view name_of(const Event& event) noexcept;

// One line, e.g. "Deposit from=00..07 amount=100".
[[nodiscard]] std::string describe(const Event& event);

}  // namespace events
}  // namespace lendcore
