#pragma once

namespace lendcore::tests {

void test_event_describe();
void test_journal();
void test_fanout_and_stream_sinks();

}  // namespace lendcore::tests
