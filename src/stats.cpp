#include "tokbench/stats.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace tokbench {

namespace {

void require_samples(std::span<const std::uint64_t> samples) {
  if (samples.empty()) {
    throw std::invalid_argument("latency statistics need at least one sample");
  }
}

std::uint64_t nearest_rank(const std::vector<std::uint64_t>& sorted, double p) {
  auto idx = static_cast<std::size_t>(std::floor(static_cast<double>(sorted.size()) * p));
  return sorted[std::min(idx, sorted.size() - 1)];
}

}  // namespace

std::uint64_t Min(std::span<const std::uint64_t> samples) {
  require_samples(samples);
  return *std::min_element(samples.begin(), samples.end());
}

std::uint64_t Max(std::span<const std::uint64_t> samples) {
  require_samples(samples);
  return *std::max_element(samples.begin(), samples.end());
}

double Mean(std::span<const std::uint64_t> samples) {
  require_samples(samples);
  long double sum = 0.0L;
  for (auto v : samples) {
    sum += static_cast<long double>(v);
  }
  return static_cast<double>(sum / static_cast<long double>(samples.size()));
}

double Stddev(std::span<const std::uint64_t> samples) {
  const double mean = Mean(samples);
  double acc = 0.0;
  for (auto v : samples) {
    const double d = static_cast<double>(v) - mean;
    acc += d * d;
  }
  return std::sqrt(acc / static_cast<double>(samples.size()));
}

std::uint64_t Percentile(std::span<const std::uint64_t> samples, double p) {
  require_samples(samples);
  std::vector<std::uint64_t> sorted(samples.begin(), samples.end());
  std::sort(sorted.begin(), sorted.end());
  return nearest_rank(sorted, p);
}

LatencySummary Summarize(std::span<const std::uint64_t> samples) {
  require_samples(samples);
  std::vector<std::uint64_t> sorted(samples.begin(), samples.end());
  std::sort(sorted.begin(), sorted.end());

  LatencySummary s;
  s.min_ns = sorted.front();
  s.max_ns = sorted.back();
  s.mean_ns = Mean(samples);
  s.stddev_ns = Stddev(samples);
  s.p50_ns = nearest_rank(sorted, 0.50);
  s.p95_ns = nearest_rank(sorted, 0.95);
  s.p99_ns = nearest_rank(sorted, 0.99);
  return s;
}

double ThroughputMbps(std::uint64_t input_bytes, double mean_ns) {
  if (mean_ns == 0.0) {
    return 0.0;
  }
  const double bytes_per_sec = static_cast<double>(input_bytes) / (mean_ns / 1e9);
  return bytes_per_sec / 1e6;
}

}  // namespace tokbench
