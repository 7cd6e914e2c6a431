#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tokbench/result.hpp"

namespace tokbench {

struct RunMeta {
  std::string input_size;  // as requested, e.g. "1MB"
  std::uint64_t input_bytes = 0;
  std::string encoding;
  std::uint64_t iterations = 0;
  std::uint64_t warmup = 0;
  std::uint64_t seed = 0;
};

// Box table, one row per result; the ratio column is relative to results[0].
[[nodiscard]] std::string FormatTable(const std::vector<BenchmarkResult>& results);

// Throughputs, token parity and verdict for results[1] vs results[0]. Empty
// when fewer than two results are present.
[[nodiscard]] std::string FormatComparisonSummary(const std::vector<BenchmarkResult>& results);

// Multi-line latency breakdown (ms) for a single result.
[[nodiscard]] std::string FormatDetail(const BenchmarkResult& result);

// {"meta": {...}, "results": [...], "comparison": {...}} with 2-space indent.
// "comparison" is only present when two results exist.
[[nodiscard]] std::string FormatJson(const RunMeta& meta, const std::vector<BenchmarkResult>& results);

}  // namespace tokbench
