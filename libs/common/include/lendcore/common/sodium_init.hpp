#pragma once

namespace lendcore {
namespace common {

// Initializes libsodium once per process. Throws std::runtime_error on failure.
void ensure_sodium_init();

}  // namespace common
}  // namespace lendcore
