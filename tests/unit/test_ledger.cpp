#include "test_ledger.hpp"

#include <cassert>
#include <cstdint>
#include <limits>
#include <vector>

#include "lendcore/digest/state_digest.hpp"
#include "lendcore/events/journal.hpp"
#include "lendcore/ledger/ledger_state.hpp"

namespace lendcore::tests {

namespace {

const common::AccountId kAdmin = common::make_account_id(1);
const common::AccountId kAlice = common::make_account_id(10);
const common::AccountId kBob = common::make_account_id(11);
const common::AccountId kCarol = common::make_account_id(12);
const common::AccountId kModel = common::make_account_id(100);
const common::AccountId kAsset = common::make_account_id(101);
const common::AccountId kOtherModel = common::make_account_id(102);
const common::AccountId kOtherAsset = common::make_account_id(103);

constexpr common::Amount kMax = std::numeric_limits<common::Amount>::max();

struct Fixture {
  events::Journal journal;
  ledger::LedgerState state{kModel, kAsset, kAdmin, journal};
};

common::Amount sum(const ledger::Book& book) {
  common::Amount total = 0;
  for (const auto& [account, amount] : book) {
    total += amount;
  }
  return total;
}

void check_invariants(const ledger::LedgerState& ledger) {
  assert(ledger.get_total_supply() == sum(ledger.balances()));
  assert(ledger.get_total_borrow() == sum(ledger.debts()));
}

template <typename T>
T last_event(const events::Journal& journal) {
  const auto entries = journal.entries();
  assert(!entries.empty());
  const auto* event = std::get_if<T>(&entries.back().event);
  assert(event != nullptr);
  return *event;
}

void expect_rejected(const ledger::TransitionResult& result, ledger::Error error) {
  assert(!result.ok());
  assert(result.error == error);
  assert(result.reject_code == ledger::reject_code(error));
}

// Leaves `account` with the given debt and collateral. remove_collateral has no
// health check, so debt may end up above collateral.
void open_position(ledger::LedgerState& ledger, const common::AccountId& account,
                   common::Amount debt, common::Amount collateral) {
  const common::Amount pledge = debt * 2 > collateral ? debt * 2 : collateral;
  assert(ledger.add_collateral(account, pledge).ok());
  assert(ledger.borrow(account, debt).ok());
  assert(ledger.remove_collateral(account, pledge - collateral).ok());
  assert(ledger.debt_of(account) == debt);
  assert(ledger.collateral_of(account) == collateral);
}

}  // namespace

void test_ledger_construction() {
  Fixture f;
  assert(f.state.admin() == kAdmin);
  assert(f.state.interest_rate_model() == kModel);
  assert(f.state.underlying_asset() == kAsset);
  assert(!f.state.paused());
  assert(f.state.get_total_supply() == 0);
  assert(f.state.get_total_borrow() == 0);
  assert(f.state.accounts().empty());

  assert(f.journal.size() == 1);
  const auto init = last_event<events::Initialized>(f.journal);
  assert(init.interest_rate_model == kModel);
  assert(init.underlying_asset == kAsset);
}

void test_deposit_and_withdraw() {
  Fixture f;

  assert(f.state.deposit(kAlice, 100).ok());
  assert(f.state.balance_of(kAlice) == 100);
  assert(f.state.get_total_supply() == 100);
  const auto deposit = last_event<events::Deposit>(f.journal);
  assert(deposit.from == kAlice);
  assert(deposit.amount == 100);

  assert(f.state.deposit(kBob, 30).ok());
  assert(f.state.get_total_supply() == 130);

  assert(f.state.withdraw(kAlice, 40).ok());
  assert(f.state.balance_of(kAlice) == 60);
  assert(f.state.get_total_supply() == 90);
  const auto withdraw = last_event<events::Withdraw>(f.journal);
  assert(withdraw.to == kAlice);
  assert(withdraw.amount == 40);

  expect_rejected(f.state.withdraw(kAlice, 61), ledger::Error::kInsufficientBalance);
  expect_rejected(f.state.withdraw(kCarol, 1), ledger::Error::kInsufficientBalance);

  assert(f.state.withdraw(kAlice, 60).ok());
  assert(f.state.balance_of(kAlice) == 0);
  assert(f.state.balances().count(kAlice) == 0);
  assert(f.state.get_total_supply() == 30);
  check_invariants(f.state);
}

void test_collateral() {
  Fixture f;

  assert(f.state.add_collateral(kAlice, 200).ok());
  assert(f.state.collateral_of(kAlice) == 200);
  const auto added = last_event<events::CollateralAdded>(f.journal);
  assert(added.user == kAlice);
  assert(added.amount == 200);

  expect_rejected(f.state.remove_collateral(kAlice, 201), ledger::Error::kInsufficientCollateral);
  assert(f.state.collateral_of(kAlice) == 200);

  assert(f.state.remove_collateral(kAlice, 50).ok());
  assert(f.state.collateral_of(kAlice) == 150);
  const auto removed = last_event<events::CollateralRemoved>(f.journal);
  assert(removed.user == kAlice);
  assert(removed.amount == 50);

  // Collateral never counts toward supply.
  assert(f.state.get_total_supply() == 0);
}

void test_borrow_bound() {
  for (const common::Amount collateral : {0ull, 1ull, 2ull, 3ull, 199ull, 200ull, 201ull, 1'000'001ull}) {
    Fixture f;
    assert(f.state.add_collateral(kAlice, collateral).ok());
    const common::Amount bound = collateral / 2;

    expect_rejected(f.state.borrow(kAlice, bound + 1), ledger::Error::kInsufficientCollateral);
    assert(f.state.debt_of(kAlice) == 0);

    assert(f.state.borrow(kAlice, bound).ok());
    assert(f.state.debt_of(kAlice) == bound);
    assert(f.state.get_total_borrow() == bound);

    expect_rejected(f.state.borrow(kAlice, 1), ledger::Error::kInsufficientCollateral);
    check_invariants(f.state);
  }

  // Existing debt counts against the bound.
  Fixture f;
  assert(f.state.add_collateral(kBob, 100).ok());
  assert(f.state.borrow(kBob, 30).ok());
  expect_rejected(f.state.borrow(kBob, 21), ledger::Error::kInsufficientCollateral);
  assert(f.state.borrow(kBob, 20).ok());
  const auto borrow = last_event<events::Borrow>(f.journal);
  assert(borrow.borrower == kBob);
  assert(borrow.amount == 20);
  assert(ledger::LedgerState::max_borrow(100) == 50);
}

void test_repay() {
  Fixture f;
  assert(f.state.add_collateral(kAlice, 100).ok());
  assert(f.state.borrow(kAlice, 50).ok());

  expect_rejected(f.state.repay(kAlice, 51), ledger::Error::kInsufficientBalance);
  expect_rejected(f.state.repay(kBob, 1), ledger::Error::kInsufficientBalance);

  assert(f.state.repay(kAlice, 20).ok());
  assert(f.state.debt_of(kAlice) == 30);
  assert(f.state.get_total_borrow() == 30);
  const auto repay = last_event<events::Repay>(f.journal);
  assert(repay.borrower == kAlice);
  assert(repay.amount == 20);

  assert(f.state.repay(kAlice, 30).ok());
  assert(f.state.debts().empty());
  assert(f.state.get_total_borrow() == 0);
  // Repayment does not release collateral.
  assert(f.state.collateral_of(kAlice) == 100);
}

void test_liquidation() {
  {
    Fixture f;
    open_position(f.state, kBob, 50, 50);

    assert(f.state.liquidate(kCarol, kBob, 50).ok());
    assert(f.state.debt_of(kBob) == 0);
    assert(f.state.collateral_of(kBob) == 0);
    assert(f.state.get_total_borrow() == 0);
    const auto liquidation = last_event<events::Liquidate>(f.journal);
    assert(liquidation.liquidator == kCarol);
    assert(liquidation.borrower == kBob);
    assert(liquidation.amount == 50);

    expect_rejected(f.state.liquidate(kCarol, kBob, 50), ledger::Error::kInsufficientBalance);
    check_invariants(f.state);
  }

  {
    // Debt is checked before collateral.
    Fixture f;
    open_position(f.state, kBob, 50, 40);
    expect_rejected(f.state.liquidate(kCarol, kBob, 60), ledger::Error::kInsufficientBalance);
    expect_rejected(f.state.liquidate(kCarol, kBob, 45), ledger::Error::kInsufficientCollateral);

    assert(f.state.liquidate(kCarol, kBob, 40).ok());
    assert(f.state.debt_of(kBob) == 10);
    assert(f.state.collateral_of(kBob) == 0);
    assert(f.state.get_total_borrow() == 10);
    check_invariants(f.state);
  }

  {
    // The borrower may liquidate itself; the liquidator's own books are untouched.
    Fixture f;
    open_position(f.state, kBob, 20, 100);
    assert(f.state.deposit(kCarol, 5).ok());
    assert(f.state.liquidate(kBob, kBob, 10).ok());
    assert(f.state.debt_of(kBob) == 10);
    assert(f.state.collateral_of(kBob) == 90);
    assert(f.state.balance_of(kCarol) == 5);
  }
}

void test_accrue_interest() {
  {
    Fixture f;
    assert(f.state.add_collateral(kAlice, 2'000).ok());
    assert(f.state.borrow(kAlice, 1'000).ok());

    assert(f.state.accrue_interest(kCarol).ok());
    assert(f.state.get_total_borrow() == 1'010);
    assert(f.state.debt_of(kAlice) == 1'010);
    assert(last_event<events::InterestAccrued>(f.journal).amount == 10);
    check_invariants(f.state);
  }

  {
    // Left-over units go to the largest truncated remainder.
    Fixture f;
    open_position(f.state, kAlice, 333, 666);
    open_position(f.state, kBob, 333, 666);
    open_position(f.state, kCarol, 334, 668);
    assert(f.state.get_total_borrow() == 1'000);

    assert(f.state.accrue_interest(kAdmin).ok());
    assert(f.state.get_total_borrow() == 1'010);
    assert(f.state.debt_of(kAlice) == 336);
    assert(f.state.debt_of(kBob) == 336);
    assert(f.state.debt_of(kCarol) == 338);
    check_invariants(f.state);
  }

  {
    // Equal remainders: lowest account id first.
    Fixture f;
    open_position(f.state, kBob, 150, 300);
    open_position(f.state, kAlice, 150, 300);

    assert(f.state.accrue_interest(kAlice).ok());
    assert(f.state.get_total_borrow() == 303);
    assert(f.state.debt_of(kAlice) == 152);
    assert(f.state.debt_of(kBob) == 151);
    check_invariants(f.state);
  }

  {
    // Below 100 the truncated interest is zero; the notification still goes out.
    Fixture f;
    open_position(f.state, kAlice, 99, 198);
    const auto before = f.journal.size();
    assert(f.state.accrue_interest(kAlice).ok());
    assert(f.state.get_total_borrow() == 99);
    assert(f.journal.size() == before + 1);
    assert(last_event<events::InterestAccrued>(f.journal).amount == 0);
  }

  {
    // Interest can push debt past the borrow bound.
    Fixture f;
    assert(f.state.add_collateral(kAlice, 200).ok());
    assert(f.state.borrow(kAlice, 100).ok());
    assert(f.state.accrue_interest(kAlice).ok());
    assert(f.state.debt_of(kAlice) == 101);
    assert(f.state.debt_of(kAlice) > ledger::LedgerState::max_borrow(f.state.collateral_of(kAlice)));
  }
}

void test_account_liquidity() {
  Fixture f;
  assert(f.state.get_account_liquidity(kAlice) == 0);
  assert(f.state.get_account_shortfall(kAlice) == 0);

  assert(f.state.add_collateral(kAlice, 100).ok());
  assert(f.state.get_account_liquidity(kAlice) == 100);

  assert(f.state.borrow(kAlice, 50).ok());
  assert(f.state.get_account_liquidity(kAlice) == 50);
  assert(f.state.get_account_shortfall(kAlice) == 0);

  // Debt above collateral: liquidity floors at zero, shortfall reports the gap.
  assert(f.state.remove_collateral(kAlice, 60).ok());
  assert(f.state.debt_of(kAlice) > f.state.collateral_of(kAlice));
  assert(f.state.get_account_liquidity(kAlice) == 0);
  assert(f.state.get_account_shortfall(kAlice) == 10);
}

void test_pause_gate() {
  Fixture f;
  open_position(f.state, kBob, 50, 100);
  assert(f.state.deposit(kAlice, 100).ok());

  assert(f.state.pause(kAdmin).ok());
  assert(f.state.paused());
  (void)last_event<events::ContractPaused>(f.journal);

  const auto notifications = f.journal.size();
  const auto snapshot = digest::state_digest(f.state);

  expect_rejected(f.state.deposit(kAlice, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.withdraw(kAlice, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.add_collateral(kAlice, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.remove_collateral(kBob, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.borrow(kBob, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.repay(kBob, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.liquidate(kCarol, kBob, 1), ledger::Error::kContractPaused);
  expect_rejected(f.state.accrue_interest(kCarol), ledger::Error::kContractPaused);
  // The gate runs before any other validation.
  expect_rejected(f.state.withdraw(kAlice, kMax), ledger::Error::kContractPaused);
  // The admin is not exempt from the gate on user transitions.
  expect_rejected(f.state.deposit(kAdmin, 1), ledger::Error::kContractPaused);

  assert(f.journal.size() == notifications);
  assert(digest::state_digest(f.state) == snapshot);

  // Queries are not gated.
  assert(f.state.get_total_supply() == 100);
  assert(f.state.get_account_liquidity(kBob) == 50);

  // Admin transitions still go through, and pausing twice re-emits.
  assert(f.state.set_interest_rate_model(kAdmin, kOtherModel).ok());
  assert(f.state.reinitialize(kAdmin, kModel, kOtherAsset).ok());
  assert(f.state.pause(kAdmin).ok());
  (void)last_event<events::ContractPaused>(f.journal);
  assert(f.journal.size() == notifications + 3);

  assert(f.state.unpause(kAdmin).ok());
  assert(!f.state.paused());
  (void)last_event<events::ContractUnpaused>(f.journal);
  assert(f.state.deposit(kAlice, 1).ok());
  assert(f.state.get_total_supply() == 101);
}

void test_admin_authorization() {
  Fixture f;
  assert(f.state.deposit(kAlice, 10).ok());
  const auto notifications = f.journal.size();
  const auto snapshot = digest::state_digest(f.state);

  for (const auto& caller : {kAlice, kBob, kModel}) {
    expect_rejected(f.state.set_interest_rate_model(caller, kOtherModel), ledger::Error::kNotAuthorized);
    expect_rejected(f.state.reinitialize(caller, kOtherModel, kOtherAsset), ledger::Error::kNotAuthorized);
    expect_rejected(f.state.pause(caller), ledger::Error::kNotAuthorized);
    expect_rejected(f.state.unpause(caller), ledger::Error::kNotAuthorized);
  }

  assert(f.journal.size() == notifications);
  assert(digest::state_digest(f.state) == snapshot);
  assert(f.state.interest_rate_model() == kModel);
  assert(!f.state.paused());

  assert(f.state.set_interest_rate_model(kAdmin, kOtherModel).ok());
  assert(f.state.interest_rate_model() == kOtherModel);
  assert(last_event<events::InterestRateModelUpdated>(f.journal).new_model == kOtherModel);

  assert(f.state.reinitialize(kAdmin, kModel, kOtherAsset).ok());
  assert(f.state.interest_rate_model() == kModel);
  assert(f.state.underlying_asset() == kOtherAsset);
  const auto reinit = last_event<events::Initialized>(f.journal);
  assert(reinit.interest_rate_model == kModel);
  assert(reinit.underlying_asset == kOtherAsset);

  // Collaborator changes leave the books alone.
  assert(f.state.balance_of(kAlice) == 10);
  assert(f.state.admin() == kAdmin);
}

void test_rejection_leaves_state_unchanged() {
  Fixture f;
  open_position(f.state, kAlice, 40, 90);
  open_position(f.state, kBob, 50, 30);
  assert(f.state.deposit(kCarol, 70).ok());

  const auto snapshot = digest::state_digest(f.state);
  const auto notifications = f.journal.size();

  expect_rejected(f.state.withdraw(kCarol, 71), ledger::Error::kInsufficientBalance);
  expect_rejected(f.state.remove_collateral(kAlice, 91), ledger::Error::kInsufficientCollateral);
  expect_rejected(f.state.borrow(kAlice, 6), ledger::Error::kInsufficientCollateral);
  expect_rejected(f.state.repay(kAlice, 41), ledger::Error::kInsufficientBalance);
  expect_rejected(f.state.liquidate(kCarol, kBob, 51), ledger::Error::kInsufficientBalance);
  expect_rejected(f.state.liquidate(kCarol, kBob, 31), ledger::Error::kInsufficientCollateral);
  expect_rejected(f.state.pause(kCarol), ledger::Error::kNotAuthorized);
  expect_rejected(f.state.deposit(kCarol, kMax), ledger::Error::kArithmeticOverflow);

  assert(digest::state_digest(f.state) == snapshot);
  assert(f.journal.size() == notifications);
  check_invariants(f.state);
}

void test_overflow_rejected() {
  {
    Fixture f;
    assert(f.state.deposit(kAlice, kMax).ok());
    expect_rejected(f.state.deposit(kAlice, 1), ledger::Error::kArithmeticOverflow);
    // Another account's deposit would overflow the total.
    expect_rejected(f.state.deposit(kBob, 1), ledger::Error::kArithmeticOverflow);
    assert(f.state.balance_of(kBob) == 0);
    assert(f.state.get_total_supply() == kMax);
  }

  {
    Fixture f;
    assert(f.state.add_collateral(kAlice, kMax).ok());
    expect_rejected(f.state.add_collateral(kAlice, 1), ledger::Error::kArithmeticOverflow);
    assert(f.state.borrow(kAlice, kMax / 2).ok());
    expect_rejected(f.state.borrow(kAlice, kMax), ledger::Error::kArithmeticOverflow);
    assert(f.state.debt_of(kAlice) == kMax / 2);
  }

  {
    Fixture f;
    assert(f.state.add_collateral(kAlice, kMax).ok());
    assert(f.state.add_collateral(kBob, kMax).ok());
    assert(f.state.borrow(kAlice, kMax / 2).ok());
    assert(f.state.borrow(kBob, kMax / 2).ok());
    assert(f.state.get_total_borrow() == kMax - 1);

    const auto snapshot = digest::state_digest(f.state);
    expect_rejected(f.state.accrue_interest(kCarol), ledger::Error::kArithmeticOverflow);
    assert(digest::state_digest(f.state) == snapshot);
  }
}

void test_invariants_after_random_sequence() {
  Fixture f;
  const std::vector<common::AccountId> accounts = {kAlice, kBob, kCarol, common::make_account_id(13),
                                                   common::make_account_id(14)};

  std::uint64_t seed = 0x9e3779b97f4a7c15ull;
  auto next = [&seed](std::uint64_t bound) {
    seed = seed * 6364136223846793005ull + 1442695040888963407ull;
    return (seed >> 33) % bound;
  };

  std::size_t accepted = 0;
  for (int step = 0; step < 5'000; ++step) {
    const auto& caller = accounts[next(accounts.size())];
    const auto& other = accounts[next(accounts.size())];
    const common::Amount amount = next(500);

    const auto notifications = f.journal.size();
    const auto snapshot = digest::state_digest(f.state);

    ledger::TransitionResult result;
    switch (next(10)) {
      case 0: result = f.state.deposit(caller, amount); break;
      case 1: result = f.state.withdraw(caller, amount); break;
      case 2: result = f.state.add_collateral(caller, amount); break;
      case 3: result = f.state.remove_collateral(caller, amount); break;
      case 4: result = f.state.borrow(caller, amount); break;
      case 5: result = f.state.repay(caller, amount); break;
      case 6: result = f.state.liquidate(caller, other, amount); break;
      case 7: result = f.state.accrue_interest(caller); break;
      case 8: result = f.state.pause(next(4) == 0 ? kAdmin : caller); break;
      default: result = f.state.unpause(kAdmin); break;
    }

    if (result.ok()) {
      ++accepted;
      assert(f.journal.size() == notifications + 1);
    } else {
      assert(f.journal.size() == notifications);
      assert(digest::state_digest(f.state) == snapshot);
    }
    check_invariants(f.state);
  }

  assert(accepted > 0);
}

void test_end_to_end_scenarios() {
  {
    Fixture f;
    assert(f.state.deposit(kAlice, 100).ok());
    assert(f.state.get_total_supply() == 100);
    assert(f.state.balance_of(kAlice) == 100);
  }

  {
    Fixture f;
    assert(f.state.deposit(kAlice, 100).ok());
    assert(f.state.add_collateral(kAlice, 200).ok());
    assert(f.state.borrow(kAlice, 100).ok());
    assert(f.state.get_total_borrow() == 100);
    expect_rejected(f.state.borrow(kAlice, 1), ledger::Error::kInsufficientCollateral);
    assert(f.state.get_total_borrow() == 100);
  }

  {
    Fixture f;
    open_position(f.state, kBob, 50, 50);
    assert(f.state.liquidate(kCarol, kBob, 50).ok());
    assert(f.state.debt_of(kBob) == 0);
    assert(f.state.collateral_of(kBob) == 0);
    expect_rejected(f.state.liquidate(kCarol, kBob, 50), ledger::Error::kInsufficientBalance);
  }

  {
    Fixture f;
    assert(f.state.add_collateral(kAlice, 2'000).ok());
    assert(f.state.borrow(kAlice, 1'000).ok());
    assert(f.state.get_total_borrow() == 1'000);
    assert(f.state.accrue_interest(kAlice).ok());
    assert(f.state.get_total_borrow() == 1'010);
  }
}

}  // namespace lendcore::tests
