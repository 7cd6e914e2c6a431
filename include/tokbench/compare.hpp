#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tokbench/result.hpp"

namespace tokbench {

enum class Verdict {
  kFaster = 0,
  kSlower,
  kComparable,
  // At least one side measured zero throughput, so no ratio exists.
  kIndeterminate,
};

inline constexpr double kFasterThreshold = 1.1;
inline constexpr double kSlowerThreshold = 0.9;

struct Comparison {
  std::string reference_name;
  std::string candidate_name;
  double reference_mbps = 0.0;
  double candidate_mbps = 0.0;
  // candidate / reference throughput; 0 when indeterminate.
  double ratio = 0.0;
  Verdict verdict = Verdict::kIndeterminate;
  std::uint64_t reference_tokens = 0;
  std::uint64_t candidate_tokens = 0;
  bool token_parity = true;
  std::uint64_t token_diff = 0;
};

// Strict thresholds: ratio > 1.1 is faster, ratio < 0.9 is slower.
[[nodiscard]] Verdict ClassifyRatio(double ratio);

[[nodiscard]] Comparison Compare(const BenchmarkResult& reference, const BenchmarkResult& candidate);

// Compares results[1] against results[0]; std::nullopt with fewer than two.
[[nodiscard]] std::optional<Comparison> CompareResults(const std::vector<BenchmarkResult>& results);

[[nodiscard]] std::string_view VerdictName(Verdict verdict);

// One-line human verdict, e.g. "llm-cost is 2.31x FASTER than tiktoken".
[[nodiscard]] std::string DescribeVerdict(const Comparison& c);

}  // namespace tokbench
