#include "lendcore/common/sodium_init.hpp"

#include <sodium.h>

#include <stdexcept>

namespace lendcore {
namespace common {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

}  // namespace

void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace common
}  // namespace lendcore
