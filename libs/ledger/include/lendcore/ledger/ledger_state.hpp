#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/events/event_sink.hpp"
#include "lendcore/ledger/errors.hpp"

namespace lendcore {
namespace ledger {

// Fixed policy: 50% loan-to-value and 1% interest per accrual.
constexpr common::Amount kMaxBorrowDivisor = 2;
constexpr common::Amount kInterestDivisor = 100;

using Book = std::unordered_map<common::AccountId, common::Amount, common::AccountIdHash>;

// Accounting state machine for a single-asset collateralized lending pool.
//
// Every mutating transition runs the same steps: pause gate (user transitions),
// admin gate (admin transitions), read, validate, apply, then publish exactly one
// notification. A rejected transition leaves every field untouched and publishes
// nothing.
//
// Calls must be serialized by the host. Zero balances are erased from the books,
// so two ledgers with the same observable state hold the same entries.
class LedgerState {
 public:
  // Records `caller` as admin and publishes Initialized.
  LedgerState(const common::AccountId& interest_rate_model,
              const common::AccountId& underlying_asset,
              const common::AccountId& caller,
              events::EventSink& sink);

  // Admin transitions. Not pause-gated.
  TransitionResult set_interest_rate_model(const common::AccountId& caller,
                                           const common::AccountId& new_model);
  TransitionResult reinitialize(const common::AccountId& caller,
                                const common::AccountId& interest_rate_model,
                                const common::AccountId& underlying_asset);
  TransitionResult pause(const common::AccountId& caller);
  TransitionResult unpause(const common::AccountId& caller);

  // User transitions.
  TransitionResult deposit(const common::AccountId& caller, common::Amount amount);
  TransitionResult withdraw(const common::AccountId& caller, common::Amount amount);
  TransitionResult add_collateral(const common::AccountId& caller, common::Amount amount);
  TransitionResult remove_collateral(const common::AccountId& caller, common::Amount amount);
  TransitionResult borrow(const common::AccountId& caller, common::Amount amount);
  TransitionResult repay(const common::AccountId& caller, common::Amount amount);
  TransitionResult liquidate(const common::AccountId& caller,
                             const common::AccountId& borrower,
                             common::Amount amount);
  TransitionResult accrue_interest(const common::AccountId& caller);

  // collateral - debt, floored at zero.
  [[nodiscard]] common::Amount get_account_liquidity(const common::AccountId& account) const;
  // debt - collateral, floored at zero. Non-zero exactly when liquidity hides a deficit.
  [[nodiscard]] common::Amount get_account_shortfall(const common::AccountId& account) const;
  [[nodiscard]] common::Amount get_total_supply() const noexcept { return total_supply_; }
  [[nodiscard]] common::Amount get_total_borrow() const noexcept { return total_borrow_; }

  [[nodiscard]] common::Amount balance_of(const common::AccountId& account) const;
  [[nodiscard]] common::Amount debt_of(const common::AccountId& account) const;
  [[nodiscard]] common::Amount collateral_of(const common::AccountId& account) const;

  [[nodiscard]] const common::AccountId& admin() const noexcept { return admin_; }
  [[nodiscard]] const common::AccountId& interest_rate_model() const noexcept { return interest_rate_model_; }
  [[nodiscard]] const common::AccountId& underlying_asset() const noexcept { return underlying_asset_; }
  [[nodiscard]] bool paused() const noexcept { return paused_; }

  [[nodiscard]] const Book& balances() const noexcept { return balances_; }
  [[nodiscard]] const Book& debts() const noexcept { return debts_; }
  [[nodiscard]] const Book& collaterals() const noexcept { return collaterals_; }

  // Every account with a non-zero balance, debt or collateral, ascending.
  [[nodiscard]] std::vector<common::AccountId> accounts() const;

  [[nodiscard]] static constexpr common::Amount max_borrow(common::Amount collateral) noexcept {
    return collateral / kMaxBorrowDivisor;
  }
  [[nodiscard]] static constexpr common::Amount interest_for(common::Amount total_borrow) noexcept {
    return total_borrow / kInterestDivisor;
  }

 private:
  events::EventSink& sink_;

  common::AccountId admin_{};
  common::AccountId interest_rate_model_{};
  common::AccountId underlying_asset_{};
  bool paused_{false};
  common::Amount total_supply_{0};
  common::Amount total_borrow_{0};
  Book balances_{};
  Book debts_{};
  Book collaterals_{};

  [[nodiscard]] std::optional<Error> not_paused() const noexcept;
  [[nodiscard]] std::optional<Error> only_admin(const common::AccountId& caller) const noexcept;

  static common::Amount read(const Book& book, const common::AccountId& account);
  static void write(Book& book, const common::AccountId& account, common::Amount value);

  // Per-account split of `interest`, summing to exactly `interest`.
  [[nodiscard]] std::vector<std::pair<common::AccountId, common::Amount>> allocate_interest(
      common::Amount interest) const;
};

}  // namespace ledger
}  // namespace lendcore
