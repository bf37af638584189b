#include "lendcore/ledger/errors.hpp"

namespace lendcore {
namespace ledger {

namespace {
constexpr std::uint16_t kRejectCodeNotAuthorized = 3001;
constexpr std::uint16_t kRejectCodeInsufficientBalance = 3002;
constexpr std::uint16_t kRejectCodeInsufficientLiquidity = 3003;
constexpr std::uint16_t kRejectCodeInsufficientCollateral = 3004;
constexpr std::uint16_t kRejectCodeContractPaused = 3005;
constexpr std::uint16_t kRejectCodeArithmeticOverflow = 3006;
}  // namespace

std::string_view to_string(Error error) noexcept {
  switch (error) {
    case Error::kNotAuthorized:
      return "NotAuthorized";
    case Error::kInsufficientBalance:
      return "InsufficientBalance";
    case Error::kInsufficientLiquidity:
      return "InsufficientLiquidity";
    case Error::kInsufficientCollateral:
      return "InsufficientCollateral";
    case Error::kContractPaused:
      return "ContractPaused";
    case Error::kArithmeticOverflow:
      return "ArithmeticOverflow";
  }
  return "Unknown";
}

std::uint16_t reject_code(Error error) noexcept {
  switch (error) {
    case Error::kNotAuthorized:
      return kRejectCodeNotAuthorized;
    case Error::kInsufficientBalance:
      return kRejectCodeInsufficientBalance;
    case Error::kInsufficientLiquidity:
      return kRejectCodeInsufficientLiquidity;
    case Error::kInsufficientCollateral:
      return kRejectCodeInsufficientCollateral;
    case Error::kContractPaused:
      return kRejectCodeContractPaused;
    case Error::kArithmeticOverflow:
      return kRejectCodeArithmeticOverflow;
  }
  return 0;
}

}  // namespace ledger
}  // namespace lendcore
