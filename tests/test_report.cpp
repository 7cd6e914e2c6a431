#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "tokbench/bench.hpp"
#include "tokbench/report.hpp"

static tokbench::BenchmarkResult make(const std::string& name, std::uint64_t tokens,
                                      std::vector<std::uint64_t> times) {
  tokbench::BenchmarkResult r;
  r.name = name;
  r.encoding = "o200k_base";
  r.input_bytes = 1'000'000;
  r.iterations = times.size();
  r.tokens = tokens;
  r.times_ns = std::move(times);
  return r;
}

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

static void test_table() {
  using namespace tokbench;
  assert(FormatTable({}) == "No results to display");

  std::vector<BenchmarkResult> results = {
      make("tiktoken", 42, {4'000'000, 4'000'000}),
      make("llm-cost", 42, {1'000'000, 1'000'000}),
  };
  auto table = FormatTable(results);
  assert(contains(table, "Benchmark Comparison"));
  assert(contains(table, "tiktoken"));
  assert(contains(table, "250.00 MB/s"));
  assert(contains(table, "1000.00 MB/s"));
  assert(contains(table, "  1.00x"));
  assert(contains(table, "  4.00x"));
  assert(contains(table, "  4.00ms"));
}

static void test_summary() {
  using namespace tokbench;
  std::vector<BenchmarkResult> one = {make("tiktoken", 42, {10})};
  assert(FormatComparisonSummary(one).empty());

  std::vector<BenchmarkResult> match = {
      make("tiktoken", 1234567, {2'000'000}),
      make("llm-cost", 1234567, {1'000'000}),
  };
  auto s = FormatComparisonSummary(match);
  assert(contains(s, "Comparison Summary"));
  assert(contains(s, "Token count matches: 1,234,567"));
  assert(contains(s, "llm-cost is 2.00x FASTER than tiktoken"));

  std::vector<BenchmarkResult> mismatch = {
      make("tiktoken", 42, {1'000'000}),
      make("llm-cost", 40, {1'000'000}),
  };
  s = FormatComparisonSummary(mismatch);
  assert(contains(s, "Token count differs by 2 (42 vs 40)"));
  assert(contains(s, "Performance is comparable (ratio: 1.00x)"));
}

static void test_detail() {
  using namespace tokbench;
  auto d = FormatDetail(make("tiktoken", 42, {1'000'000, 3'000'000}));
  assert(contains(d, "tiktoken (o200k_base):"));
  assert(contains(d, "Iterations:  2"));
  assert(contains(d, "mean:   2.000 ms"));
  assert(contains(d, "stddev: 1.000 ms"));
}

static void test_json() {
  using namespace tokbench;
  RunMeta meta;
  meta.input_size = "1MB";
  meta.input_bytes = 1'048'576;
  meta.encoding = "o200k_base";
  meta.iterations = 3;
  meta.warmup = 1;
  meta.seed = 42;

  std::vector<BenchmarkResult> results = {
      make("tiktoken", 42, {30, 10, 20}),
      make("llm-cost", 40, {3, 3, 4}),
  };
  auto j = nlohmann::json::parse(FormatJson(meta, results));
  assert(j["meta"]["input_size"] == "1MB");
  assert(j["meta"]["input_bytes"] == 1048576);
  assert(j["meta"]["encoding"] == "o200k_base");
  assert(j["meta"]["iterations"] == 3);
  assert(j["results"].size() == 2);

  const auto& r0 = j["results"][0];
  assert(r0["name"] == "tiktoken");
  assert(r0["tokens"] == 42);
  assert(r0["input_bytes"] == 1000000);
  assert(r0["iterations"] == 3);
  assert(r0["latency_ns"]["min"] == 10);
  assert(r0["latency_ns"]["p50"] == 20);
  assert(r0["latency_ns"]["p95"] == 30);
  assert(r0["latency_ns"]["p99"] == 30);
  assert(r0["latency_ns"]["max"] == 30);
  assert(r0["latency_ns"]["mean"] == 20);
  // 1e6 bytes every 20ns -> 50,000,000 MB/s
  assert(r0["throughput_mbps"].get<double>() == 50000000.0);

  // mean 3.333.. truncates to 3; throughput rounds to 4 decimals.
  const auto& r1 = j["results"][1];
  assert(r1["latency_ns"]["mean"] == 3);
  double tp = r1["throughput_mbps"].get<double>();
  assert(tp == 300000000.0);

  assert(j["comparison"]["verdict"] == "faster");
  assert(j["comparison"]["token_parity"] == false);
  assert(j["comparison"]["token_diff"] == 2);

  auto single = nlohmann::json::parse(FormatJson(meta, {results[0]}));
  assert(!single.contains("comparison"));
  assert(single["results"].size() == 1);
}

static void test_render() {
  using namespace tokbench;
  BenchConfig cfg;
  std::string err;
  assert(ValidateConfig(cfg, err));
  std::vector<BenchmarkResult> results = {make("bpe", 42, {1'000'000})};

  auto table = RenderReport(cfg, results);
  assert(contains(table, "Benchmark Comparison"));
  assert(!contains(table, "Comparison Summary"));

  cfg.detail = true;
  assert(contains(RenderReport(cfg, results), "bpe (o200k_base):"));

  cfg.format = OutputFormat::json;
  auto j = nlohmann::json::parse(RenderReport(cfg, results));
  assert(j["meta"]["input_bytes"] == 1048576);

  assert(CandidateName("./zig-out/bin/llm-cost") == "llm-cost");
  assert(CandidateName("") == "candidate");
}

int main() {
  test_table();
  test_summary();
  test_detail();
  test_json();
  test_render();
  return 0;
}
