#include "lendcore/common/types.hpp"

#include <sodium.h>

#include <algorithm>

#include "lendcore/common/sodium_init.hpp"

namespace lendcore {
namespace common {

bool AccountId::is_zero() const noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

std::string AccountId::to_hex() const {
  ensure_sodium_init();
  std::string out(kAccountIdSize * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
  out.resize(kAccountIdSize * 2);
  return out;
}

std::optional<AccountId> AccountId::from_hex(std::string_view hex) {
  if (hex.size() != kAccountIdSize * 2) {
    return std::nullopt;
  }
  ensure_sodium_init();

  AccountId id;
  std::size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(id.bytes.data(), id.bytes.size(), hex.data(), hex.size(),
                     nullptr, &decoded, &end) != 0) {
    return std::nullopt;
  }
  if (decoded != kAccountIdSize || end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  return id;
}

}  // namespace common
}  // namespace lendcore
