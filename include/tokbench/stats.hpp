#pragma once

#include <cstdint>
#include <span>

namespace tokbench {

// Latency summary in nanoseconds. Percentiles use the nearest-rank rule
// (no interpolation), so every value is one of the recorded samples.
struct LatencySummary {
  std::uint64_t min_ns = 0;
  std::uint64_t max_ns = 0;
  double mean_ns = 0.0;
  double stddev_ns = 0.0;
  std::uint64_t p50_ns = 0;
  std::uint64_t p95_ns = 0;
  std::uint64_t p99_ns = 0;
};

// All functions below throw std::invalid_argument on an empty sample set.
[[nodiscard]] std::uint64_t Min(std::span<const std::uint64_t> samples);
[[nodiscard]] std::uint64_t Max(std::span<const std::uint64_t> samples);
[[nodiscard]] double Mean(std::span<const std::uint64_t> samples);
// Population standard deviation.
[[nodiscard]] double Stddev(std::span<const std::uint64_t> samples);
// idx = floor(n * p), clamped to n - 1, on a sorted copy.
[[nodiscard]] std::uint64_t Percentile(std::span<const std::uint64_t> samples, double p);
[[nodiscard]] LatencySummary Summarize(std::span<const std::uint64_t> samples);

// MB/s (10^6 bytes) for `input_bytes` processed once per `mean_ns`; 0 when
// mean_ns is 0.
[[nodiscard]] double ThroughputMbps(std::uint64_t input_bytes, double mean_ns);

}  // namespace tokbench
