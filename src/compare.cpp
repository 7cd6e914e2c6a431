#include "tokbench/compare.hpp"

#include <iomanip>
#include <sstream>

namespace tokbench {

Verdict ClassifyRatio(double ratio) {
  if (ratio > kFasterThreshold) {
    return Verdict::kFaster;
  }
  if (ratio < kSlowerThreshold) {
    return Verdict::kSlower;
  }
  return Verdict::kComparable;
}

Comparison Compare(const BenchmarkResult& reference, const BenchmarkResult& candidate) {
  Comparison c;
  c.reference_name = reference.name;
  c.candidate_name = candidate.name;
  c.reference_mbps = reference.ThroughputMbps();
  c.candidate_mbps = candidate.ThroughputMbps();
  if (c.reference_mbps > 0.0 && c.candidate_mbps > 0.0) {
    c.ratio = c.candidate_mbps / c.reference_mbps;
    c.verdict = ClassifyRatio(c.ratio);
  } else {
    c.ratio = 0.0;
    c.verdict = Verdict::kIndeterminate;
  }

  c.reference_tokens = reference.tokens;
  c.candidate_tokens = candidate.tokens;
  c.token_parity = reference.tokens == candidate.tokens;
  c.token_diff = reference.tokens > candidate.tokens ? reference.tokens - candidate.tokens
                                                     : candidate.tokens - reference.tokens;
  return c;
}

std::optional<Comparison> CompareResults(const std::vector<BenchmarkResult>& results) {
  if (results.size() < 2) {
    return std::nullopt;
  }
  return Compare(results[0], results[1]);
}

std::string_view VerdictName(Verdict verdict) {
  switch (verdict) {
    case Verdict::kFaster:
      return "faster";
    case Verdict::kSlower:
      return "slower";
    case Verdict::kComparable:
      return "comparable";
    case Verdict::kIndeterminate:
      return "indeterminate";
  }
  return "indeterminate";
}

std::string DescribeVerdict(const Comparison& c) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  switch (c.verdict) {
    case Verdict::kFaster:
      oss << c.candidate_name << " is " << c.ratio << "x FASTER than " << c.reference_name;
      break;
    case Verdict::kSlower:
      oss << c.candidate_name << " is " << (1.0 / c.ratio) << "x SLOWER than " << c.reference_name;
      break;
    case Verdict::kComparable:
      oss << "Performance is comparable (ratio: " << c.ratio << "x)";
      break;
    case Verdict::kIndeterminate:
      oss << "Performance ratio is indeterminate (zero throughput measured)";
      break;
  }
  return oss.str();
}

}  // namespace tokbench
