#include "tokbench/report.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "tokbench/compare.hpp"

namespace tokbench {

namespace {

double to_ms(double ns) {
  return ns / 1e6;
}

// 1234567 -> "1,234,567"
std::string group_thousands(std::uint64_t v) {
  std::string digits = std::to_string(v);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && (digits.size() - i) % 3 == 0) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

nlohmann::ordered_json result_to_json(const BenchmarkResult& r) {
  const auto s = r.Summary();
  nlohmann::ordered_json latency;
  latency["min"] = s.min_ns;
  latency["p50"] = s.p50_ns;
  latency["p95"] = s.p95_ns;
  latency["p99"] = s.p99_ns;
  latency["max"] = s.max_ns;
  latency["mean"] = static_cast<std::uint64_t>(s.mean_ns);
  latency["stddev"] = static_cast<std::uint64_t>(s.stddev_ns);

  nlohmann::ordered_json j;
  j["name"] = r.name;
  j["encoding"] = r.encoding;
  j["input_bytes"] = r.input_bytes;
  j["iterations"] = r.iterations;
  j["tokens"] = r.tokens;
  j["throughput_mbps"] = std::round(r.ThroughputMbps() * 1e4) / 1e4;
  j["latency_ns"] = std::move(latency);
  return j;
}

}  // namespace

std::string FormatTable(const std::vector<BenchmarkResult>& results) {
  if (results.empty()) {
    return "No results to display";
  }

  const double baseline = results.front().ThroughputMbps();

  std::ostringstream oss;
  oss << "╔════════════════════════════════════════════════════════════════════════════╗\n"
      << "║                        Benchmark Comparison                                ║\n"
      << "╠════════════════════════════════════════════════════════════════════════════╣\n"
      << "║ Implementation │ Throughput  │   p50    │   p95    │   p99    │   Ratio   ║\n"
      << "╟────────────────┼─────────────┼──────────┼──────────┼──────────┼───────────╢\n";

  for (const auto& r : results) {
    const auto s = r.Summary();
    const double mbps = r.ThroughputMbps();
    const double ratio = baseline > 0.0 ? mbps / baseline : 0.0;
    char row[256];
    std::snprintf(row, sizeof(row),
                  "║ %-14.14s │ %7.2f MB/s│ %6.2fms │ %6.2fms │ %6.2fms │ %6.2fx   ║\n", r.name.c_str(), mbps,
                  to_ms(static_cast<double>(s.p50_ns)), to_ms(static_cast<double>(s.p95_ns)),
                  to_ms(static_cast<double>(s.p99_ns)), ratio);
    oss << row;
  }
  oss << "╚════════════════════════════════════════════════════════════════════════════╝";
  return oss.str();
}

std::string FormatComparisonSummary(const std::vector<BenchmarkResult>& results) {
  auto cmp = CompareResults(results);
  if (!cmp) {
    return {};
  }
  const auto& c = *cmp;

  std::ostringstream oss;
  char line[256];
  oss << "\n\n── Comparison Summary ──\n\n";
  std::snprintf(line, sizeof(line), "  %-10s %7.2f MB/s (%s tokens)\n", (c.reference_name + ":").c_str(),
                c.reference_mbps, group_thousands(c.reference_tokens).c_str());
  oss << line;
  std::snprintf(line, sizeof(line), "  %-10s %7.2f MB/s (%s tokens)\n", (c.candidate_name + ":").c_str(),
                c.candidate_mbps, group_thousands(c.candidate_tokens).c_str());
  oss << line << "\n";

  if (c.token_parity) {
    oss << "  ✓ Token count matches: " << group_thousands(c.reference_tokens) << "\n";
  } else {
    oss << "  ⚠️ Token count differs by " << c.token_diff << " (" << c.reference_tokens << " vs "
        << c.candidate_tokens << ")\n";
  }
  oss << "\n";

  switch (c.verdict) {
    case Verdict::kFaster:
      oss << "  ✅ ";
      break;
    case Verdict::kSlower:
      oss << "  ⚠️  ";
      break;
    case Verdict::kComparable:
      oss << "  ≈ ";
      break;
    case Verdict::kIndeterminate:
      oss << "  ? ";
      break;
  }
  oss << DescribeVerdict(c);
  return oss.str();
}

std::string FormatDetail(const BenchmarkResult& result) {
  const auto s = result.Summary();
  char buf[1024];
  std::snprintf(buf, sizeof(buf),
                "%s (%s):\n"
                "  Input:       %llu bytes\n"
                "  Iterations:  %llu\n"
                "  Tokens:      %llu\n"
                "  Throughput:  %.2f MB/s\n"
                "  Latency:\n"
                "    min:    %.3f ms\n"
                "    p50:    %.3f ms\n"
                "    p95:    %.3f ms\n"
                "    p99:    %.3f ms\n"
                "    max:    %.3f ms\n"
                "    mean:   %.3f ms\n"
                "    stddev: %.3f ms\n",
                result.name.c_str(), result.encoding.c_str(), static_cast<unsigned long long>(result.input_bytes),
                static_cast<unsigned long long>(result.iterations), static_cast<unsigned long long>(result.tokens),
                result.ThroughputMbps(), to_ms(static_cast<double>(s.min_ns)), to_ms(static_cast<double>(s.p50_ns)),
                to_ms(static_cast<double>(s.p95_ns)), to_ms(static_cast<double>(s.p99_ns)),
                to_ms(static_cast<double>(s.max_ns)), to_ms(s.mean_ns), to_ms(s.stddev_ns));
  return buf;
}

std::string FormatJson(const RunMeta& meta, const std::vector<BenchmarkResult>& results) {
  nlohmann::ordered_json j;
  j["meta"] = {
      {"input_size", meta.input_size},
      {"input_bytes", meta.input_bytes},
      {"encoding", meta.encoding},
      {"iterations", meta.iterations},
      {"warmup", meta.warmup},
      {"seed", meta.seed},
  };

  auto arr = nlohmann::ordered_json::array();
  for (const auto& r : results) {
    arr.push_back(result_to_json(r));
  }
  j["results"] = std::move(arr);

  if (auto cmp = CompareResults(results)) {
    j["comparison"] = {
        {"reference", cmp->reference_name},
        {"candidate", cmp->candidate_name},
        {"ratio", std::round(cmp->ratio * 1e4) / 1e4},
        {"verdict", std::string(VerdictName(cmp->verdict))},
        {"token_parity", cmp->token_parity},
        {"token_diff", cmp->token_diff},
    };
  }
  return j.dump(2);
}

}  // namespace tokbench
