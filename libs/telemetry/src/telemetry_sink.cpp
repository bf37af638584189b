#include "lendcore/telemetry/telemetry_sink.hpp"

#include <algorithm>
#include <bit>
#include <utility>

namespace lendcore {
namespace telemetry {

std::size_t LatencyHistogram::bucket_index(std::int64_t value_ns) noexcept {
  if (value_ns <= 0) {
    return 0;
  }
  // bucket[i] covers [2^(i-1), 2^i)
  const auto bits = std::bit_width(static_cast<std::uint64_t>(value_ns));
  return std::min(static_cast<std::size_t>(bits), kNumBuckets - 1);
}

std::int64_t LatencyHistogram::bucket_midpoint(std::size_t idx) noexcept {
  if (idx < 2) {
    return 1;
  }
  return static_cast<std::int64_t>(3) << (idx - 2);
}

void LatencyHistogram::record(std::int64_t value_ns) noexcept {
  ++buckets_[bucket_index(value_ns)];
  ++count_;
  sum_ += value_ns;
  max_ = std::max(max_, value_ns);
}

double LatencyHistogram::mean() const noexcept {
  if (count_ == 0) {
    return 0.0;
  }
  return static_cast<double>(sum_) / static_cast<double>(count_);
}

double LatencyHistogram::percentile(double p) const noexcept {
  if (count_ == 0) {
    return 0.0;
  }

  const auto target = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(static_cast<double>(count_) * p));
  std::uint64_t cumulative = 0;
  for (std::size_t idx = 0; idx < kNumBuckets; ++idx) {
    cumulative += buckets_[idx];
    if (cumulative >= target) {
      return static_cast<double>(bucket_midpoint(idx));
    }
  }
  return static_cast<double>(max_);
}

void TelemetrySink::increment(MetricId metric, std::int64_t delta) {
  std::scoped_lock lock(mutex_);
  buffer_.push_back(Sample{.metric = metric, .value = delta});
  totals_[metric] += delta;
}

void TelemetrySink::record_latency(MetricId metric, std::chrono::nanoseconds latency) {
  std::scoped_lock lock(mutex_);
  histograms_[metric].record(latency.count());
}

std::int64_t TelemetrySink::counter(MetricId metric) const {
  std::scoped_lock lock(mutex_);
  if (auto it = totals_.find(metric); it != totals_.end()) {
    return it->second;
  }
  return 0;
}

std::vector<Sample> TelemetrySink::drain() {
  std::scoped_lock lock(mutex_);
  auto copy = std::move(buffer_);
  buffer_.clear();
  return copy;
}

std::vector<TelemetrySink::Summary> TelemetrySink::drain_latency() {
  std::scoped_lock lock(mutex_);
  std::vector<Summary> summaries;
  summaries.reserve(histograms_.size());

  for (const auto& [metric, hist] : histograms_) {
    summaries.push_back(Summary{
        .metric = metric,
        .count = hist.count(),
        .mean_ns = hist.mean(),
        .p50_ns = hist.percentile(0.50),
        .p99_ns = hist.percentile(0.99),
    });
  }
  histograms_.clear();
  return summaries;
}

}  // namespace telemetry
}  // namespace lendcore
