#include "lendcore/events/events.hpp"

#include <sstream>

namespace lendcore {
namespace events {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string_view name_of(const Event& event) noexcept {
  return std::visit(
      Overloaded{
          [](const Initialized&) -> std::string_view { return "Initialized"; },
          [](const Deposit&) -> std::string_view { return "Deposit"; },
          [](const Withdraw&) -> std::string_view { return "Withdraw"; },
          [](const Borrow&) -> std::string_view { return "Borrow"; },
          [](const Repay&) -> std::string_view { return "Repay"; },
          [](const Liquidate&) -> std::string_view { return "Liquidate"; },
          [](const InterestAccrued&) -> std::string_view { return "InterestAccrued"; },
          [](const InterestRateModelUpdated&) -> std::string_view { return "InterestRateModelUpdated"; },
          [](const CollateralAdded&) -> std::string_view { return "CollateralAdded"; },
          [](const CollateralRemoved&) -> std::string_view { return "CollateralRemoved"; },
          [](const ContractPaused&) -> std::string_view { return "ContractPaused"; },
          [](const ContractUnpaused&) -> std::string_view { return "ContractUnpaused"; },
      },
      event);
}

std::string describe(const Event& event) {
  std::ostringstream oss;
  oss << name_of(event);

  std::visit(
      Overloaded{
          [&](const Initialized& e) {
            oss << " interest_rate_model=" << e.interest_rate_model.to_hex()
                << " underlying_asset=" << e.underlying_asset.to_hex();
          },
          [&](const Deposit& e) { oss << " from=" << e.from.to_hex() << " amount=" << e.amount; },
          [&](const Withdraw& e) { oss << " to=" << e.to.to_hex() << " amount=" << e.amount; },
          [&](const Borrow& e) { oss << " borrower=" << e.borrower.to_hex() << " amount=" << e.amount; },
          [&](const Repay& e) { oss << " borrower=" << e.borrower.to_hex() << " amount=" << e.amount; },
          [&](const Liquidate& e) {
            oss << " liquidator=" << e.liquidator.to_hex() << " borrower=" << e.borrower.to_hex()
                << " amount=" << e.amount;
          },
          [&](const InterestAccrued& e) { oss << " amount=" << e.amount; },
          [&](const InterestRateModelUpdated& e) { oss << " new_model=" << e.new_model.to_hex(); },
          [&](const CollateralAdded& e) { oss << " user=" << e.user.to_hex() << " amount=" << e.amount; },
          [&](const CollateralRemoved& e) { oss << " user=" << e.user.to_hex() << " amount=" << e.amount; },
          [](const ContractPaused&) {},
          [](const ContractUnpaused&) {},
      },
      event);

  return oss.str();
}

}  // namespace events
}  // namespace lendcore
