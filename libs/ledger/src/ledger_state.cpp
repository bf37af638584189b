#include "lendcore/ledger/ledger_state.hpp"

#include <algorithm>
#include <set>

#include "lendcore/common/checked_math.hpp"

namespace lendcore {
namespace ledger {

LedgerState::LedgerState(const common::AccountId& interest_rate_model,
                         const common::AccountId& underlying_asset,
                         const common::AccountId& caller,
                         events::EventSink& sink)
    : sink_(sink),
      admin_(caller),
      interest_rate_model_(interest_rate_model),
      underlying_asset_(underlying_asset) {
  sink_.publish(events::Initialized{
      .interest_rate_model = interest_rate_model,
      .underlying_asset = underlying_asset,
  });
}

TransitionResult LedgerState::set_interest_rate_model(const common::AccountId& caller,
                                                      const common::AccountId& new_model) {
  if (auto err = only_admin(caller)) {
    return TransitionResult::rejected(*err);
  }

  interest_rate_model_ = new_model;

  sink_.publish(events::InterestRateModelUpdated{.new_model = new_model});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::reinitialize(const common::AccountId& caller,
                                           const common::AccountId& interest_rate_model,
                                           const common::AccountId& underlying_asset) {
  if (auto err = only_admin(caller)) {
    return TransitionResult::rejected(*err);
  }

  interest_rate_model_ = interest_rate_model;
  underlying_asset_ = underlying_asset;

  sink_.publish(events::Initialized{
      .interest_rate_model = interest_rate_model,
      .underlying_asset = underlying_asset,
  });
  return TransitionResult::accepted();
}

TransitionResult LedgerState::pause(const common::AccountId& caller) {
  if (auto err = only_admin(caller)) {
    return TransitionResult::rejected(*err);
  }

  paused_ = true;

  sink_.publish(events::ContractPaused{});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::unpause(const common::AccountId& caller) {
  if (auto err = only_admin(caller)) {
    return TransitionResult::rejected(*err);
  }

  paused_ = false;

  sink_.publish(events::ContractUnpaused{});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::deposit(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto balance = common::checked_add(read(balances_, caller), amount);
  const auto supply = common::checked_add(total_supply_, amount);
  if (!balance || !supply) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(balances_, caller, *balance);
  total_supply_ = *supply;

  sink_.publish(events::Deposit{.from = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::withdraw(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto balance = common::checked_sub(read(balances_, caller), amount);
  if (!balance) {
    return TransitionResult::rejected(Error::kInsufficientBalance);
  }
  const auto supply = common::checked_sub(total_supply_, amount);
  if (!supply) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(balances_, caller, *balance);
  total_supply_ = *supply;

  sink_.publish(events::Withdraw{.to = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::add_collateral(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto collateral = common::checked_add(read(collaterals_, caller), amount);
  if (!collateral) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(collaterals_, caller, *collateral);

  sink_.publish(events::CollateralAdded{.user = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::remove_collateral(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto collateral = common::checked_sub(read(collaterals_, caller), amount);
  if (!collateral) {
    return TransitionResult::rejected(Error::kInsufficientCollateral);
  }

  write(collaterals_, caller, *collateral);

  sink_.publish(events::CollateralRemoved{.user = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::borrow(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const common::Amount collateral = read(collaterals_, caller);
  const auto debt = common::checked_add(read(debts_, caller), amount);
  if (!debt) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }
  if (max_borrow(collateral) < *debt) {
    return TransitionResult::rejected(Error::kInsufficientCollateral);
  }
  const auto total = common::checked_add(total_borrow_, amount);
  if (!total) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(debts_, caller, *debt);
  total_borrow_ = *total;

  sink_.publish(events::Borrow{.borrower = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::repay(const common::AccountId& caller, common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto debt = common::checked_sub(read(debts_, caller), amount);
  if (!debt) {
    return TransitionResult::rejected(Error::kInsufficientBalance);
  }
  const auto total = common::checked_sub(total_borrow_, amount);
  if (!total) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(debts_, caller, *debt);
  total_borrow_ = *total;

  sink_.publish(events::Repay{.borrower = caller, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::liquidate(const common::AccountId& caller,
                                        const common::AccountId& borrower,
                                        common::Amount amount) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const auto debt = common::checked_sub(read(debts_, borrower), amount);
  if (!debt) {
    return TransitionResult::rejected(Error::kInsufficientBalance);
  }
  const auto collateral = common::checked_sub(read(collaterals_, borrower), amount);
  if (!collateral) {
    return TransitionResult::rejected(Error::kInsufficientCollateral);
  }
  const auto total = common::checked_sub(total_borrow_, amount);
  if (!total) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  write(debts_, borrower, *debt);
  write(collaterals_, borrower, *collateral);
  total_borrow_ = *total;

  sink_.publish(events::Liquidate{.liquidator = caller, .borrower = borrower, .amount = amount});
  return TransitionResult::accepted();
}

TransitionResult LedgerState::accrue_interest(const common::AccountId& /*caller*/) {
  if (auto err = not_paused()) {
    return TransitionResult::rejected(*err);
  }

  const common::Amount interest = interest_for(total_borrow_);
  const auto total = common::checked_add(total_borrow_, interest);
  if (!total) {
    return TransitionResult::rejected(Error::kArithmeticOverflow);
  }

  std::vector<std::pair<common::AccountId, common::Amount>> updated;
  for (const auto& [account, share] : allocate_interest(interest)) {
    const auto debt = common::checked_add(read(debts_, account), share);
    if (!debt) {
      return TransitionResult::rejected(Error::kArithmeticOverflow);
    }
    updated.emplace_back(account, *debt);
  }

  for (const auto& [account, debt] : updated) {
    write(debts_, account, debt);
  }
  total_borrow_ = *total;

  sink_.publish(events::InterestAccrued{.amount = interest});
  return TransitionResult::accepted();
}

common::Amount LedgerState::get_account_liquidity(const common::AccountId& account) const {
  return common::saturating_sub(read(collaterals_, account), read(debts_, account));
}

common::Amount LedgerState::get_account_shortfall(const common::AccountId& account) const {
  return common::saturating_sub(read(debts_, account), read(collaterals_, account));
}

common::Amount LedgerState::balance_of(const common::AccountId& account) const {
  return read(balances_, account);
}

common::Amount LedgerState::debt_of(const common::AccountId& account) const {
  return read(debts_, account);
}

common::Amount LedgerState::collateral_of(const common::AccountId& account) const {
  return read(collaterals_, account);
}

std::vector<common::AccountId> LedgerState::accounts() const {
  std::set<common::AccountId> unique;
  for (const auto* book : {&balances_, &debts_, &collaterals_}) {
    for (const auto& [account, amount] : *book) {
      unique.insert(account);
    }
  }
  return {unique.begin(), unique.end()};
}

std::optional<Error> LedgerState::not_paused() const noexcept {
  if (paused_) {
    return Error::kContractPaused;
  }
  return std::nullopt;
}

std::optional<Error> LedgerState::only_admin(const common::AccountId& caller) const noexcept {
  if (caller != admin_) {
    return Error::kNotAuthorized;
  }
  return std::nullopt;
}

common::Amount LedgerState::read(const Book& book, const common::AccountId& account) {
  if (auto it = book.find(account); it != book.end()) {
    return it->second;
  }
  return 0;
}

void LedgerState::write(Book& book, const common::AccountId& account, common::Amount value) {
  if (value == 0) {
    book.erase(account);
    return;
  }
  book[account] = value;
}

std::vector<std::pair<common::AccountId, common::Amount>> LedgerState::allocate_interest(
    common::Amount interest) const {
  std::vector<std::pair<common::AccountId, common::Amount>> shares(debts_.begin(), debts_.end());
  std::sort(shares.begin(), shares.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

  std::vector<common::Amount> remainders;
  remainders.reserve(shares.size());
  common::Amount allocated = 0;
  for (auto& [account, amount] : shares) {
    remainders.push_back(amount % kInterestDivisor);
    amount /= kInterestDivisor;
    allocated += amount;
  }

  // Floor shares leave fewer than shares.size() units over; hand them out by
  // largest truncated remainder, lowest id first on ties.
  std::vector<std::size_t> order(shares.size());
  for (std::size_t i = 0; i < order.size(); ++i) {
    order[i] = i;
  }
  std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
    return remainders[lhs] > remainders[rhs];
  });

  const common::Amount leftover = common::saturating_sub(interest, allocated);
  for (std::size_t i = 0; i < order.size() && i < leftover; ++i) {
    shares[order[i]].second += 1;
  }

  std::erase_if(shares, [](const auto& share) { return share.second == 0; });
  return shares;
}

}  // namespace ledger
}  // namespace lendcore
