#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tokbench/stats.hpp"

namespace tokbench {

// One measured implementation on one corpus. Derived statistics are
// recomputed from times_ns on every call.
struct BenchmarkResult {
  std::string name;
  std::string encoding;
  std::uint64_t input_bytes = 0;
  std::uint64_t iterations = 0;
  // Observed on the first timed iteration; assumed stable afterwards.
  std::uint64_t tokens = 0;
  std::vector<std::uint64_t> times_ns;

  [[nodiscard]] std::uint64_t MinNs() const { return Min(times_ns); }
  [[nodiscard]] std::uint64_t MaxNs() const { return Max(times_ns); }
  [[nodiscard]] double MeanNs() const { return Mean(times_ns); }
  [[nodiscard]] double StddevNs() const { return Stddev(times_ns); }
  [[nodiscard]] std::uint64_t P50Ns() const { return Percentile(times_ns, 0.50); }
  [[nodiscard]] std::uint64_t P95Ns() const { return Percentile(times_ns, 0.95); }
  [[nodiscard]] std::uint64_t P99Ns() const { return Percentile(times_ns, 0.99); }
  [[nodiscard]] double ThroughputMbps() const { return tokbench::ThroughputMbps(input_bytes, MeanNs()); }
  [[nodiscard]] LatencySummary Summary() const { return Summarize(times_ns); }
};

}  // namespace tokbench
