#pragma once

namespace lendcore::tests {

void test_state_digest();

}  // namespace lendcore::tests
