#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace lendcore {
namespace telemetry {

using MetricId = std::uint32_t;

struct Sample {
  MetricId metric{};
  std::int64_t value{};
};

// log2 buckets from 1ns to ~1s. O(1) record, O(buckets) percentile.
class LatencyHistogram {
 public:
  static constexpr std::size_t kNumBuckets = 30;

  void record(std::int64_t value_ns) noexcept;

  [[nodiscard]] std::uint64_t count() const noexcept { return count_; }
  [[nodiscard]] std::int64_t max() const noexcept { return max_; }
  [[nodiscard]] double mean() const noexcept;
  [[nodiscard]] double percentile(double p) const noexcept;

 private:
  std::array<std::uint64_t, kNumBuckets> buckets_{};
  std::uint64_t count_{0};
  std::int64_t sum_{0};
  std::int64_t max_{0};

  static std::size_t bucket_index(std::int64_t value_ns) noexcept;
  static std::int64_t bucket_midpoint(std::size_t idx) noexcept;
};

class TelemetrySink {
 public:
  struct Summary {
    MetricId metric{0};
    std::uint64_t count{0};
    double mean_ns{0.0};
    double p50_ns{0.0};
    double p99_ns{0.0};
  };

  void increment(MetricId metric, std::int64_t delta = 1);
  void record_latency(MetricId metric, std::chrono::nanoseconds latency);

  // Running total of every increment for `metric`; unaffected by drain().
  [[nodiscard]] std::int64_t counter(MetricId metric) const;

  [[nodiscard]] std::vector<Sample> drain();
  [[nodiscard]] std::vector<Summary> drain_latency();

 private:
  mutable std::mutex mutex_;
  std::vector<Sample> buffer_{};
  std::map<MetricId, std::int64_t> totals_{};
  std::map<MetricId, LatencyHistogram> histograms_{};
};

}  // namespace telemetry
}  // namespace lendcore
