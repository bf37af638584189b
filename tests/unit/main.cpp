// Unit test runner - calls test functions from per-component test files

#include "test_common.hpp"
#include "test_config.hpp"
#include "test_digest.hpp"
#include "test_events.hpp"
#include "test_host.hpp"
#include "test_ledger.hpp"
#include "test_telemetry.hpp"

int main() {
  using namespace lendcore::tests;

  // Common tests
  test_account_id_hex();
  test_checked_math();

  // Event tests
  test_event_describe();
  test_journal();
  test_fanout_and_stream_sinks();

  // Ledger tests
  test_ledger_construction();
  test_deposit_and_withdraw();
  test_collateral();
  test_borrow_bound();
  test_repay();
  test_liquidation();
  test_accrue_interest();
  test_account_liquidity();
  test_pause_gate();
  test_admin_authorization();
  test_rejection_leaves_state_unchanged();
  test_overflow_rejected();
  test_invariants_after_random_sequence();
  test_end_to_end_scenarios();

  // Digest tests
  test_state_digest();

  // Config tests
  test_config_defaults();
  test_config_validation();
  test_config_parse_error();

  // Telemetry tests
  test_telemetry_sink();

  // Host tests
  test_directory();
  test_dispatcher_script();
  test_dispatcher_parse_errors();
  test_dispatcher_drained_journal();

  return 0;
}
