#include "tokbench/bench.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "tokbench/corpus.hpp"
#include "tokbench/report.hpp"
#include "tokbench/runner.hpp"
#include "tokbench/size.hpp"

namespace tokbench {

std::string CandidateName(const std::string& binary_path) {
  auto name = std::filesystem::path(binary_path).filename().string();
  return name.empty() ? std::string("candidate") : name;
}

std::vector<BenchmarkResult> RunBenchmarks(const BenchConfig& cfg, const Encoder& reference) {
  std::cerr << "[tokbench] generating " << cfg.size << " test data (seed " << cfg.seed << ")...\n";
  const std::string text = GenerateCorpus(static_cast<std::size_t>(cfg.size_bytes), cfg.seed);
  std::cerr << "[tokbench]   generated " << text.size() << " bytes (" << FormatBytes(text.size()) << ")\n";

  RunConfig rc;
  rc.encoding = cfg.encoding;
  rc.iterations = cfg.iterations;
  rc.warmup = cfg.warmup;
  rc.progress_interval_ms = cfg.progress_interval_ms;

  std::cerr << "[tokbench] running benchmarks (" << cfg.iterations << " iterations, " << cfg.warmup
            << " warmup)...\n";

  std::vector<BenchmarkResult> results;
  auto log_throughput = [](const BenchmarkResult& r) {
    std::cerr << "[tokbench]     " << std::fixed << std::setprecision(2) << r.ThroughputMbps() << " MB/s\n";
  };

  const std::string reference_name(ReferenceBackendName(cfg.reference));
  if (cfg.reference == ReferenceBackend::kBpe) {
    std::cerr << "warning: bpe reference counts approximate " << cfg.encoding
              << "; use --reference tiktoken for exact parity\n";
  }
  std::cerr << "[tokbench]   benchmarking " << reference_name << "...\n";
  LibraryRunner library(reference, reference_name);
  results.push_back(library.Measure(text, rc));
  log_throughput(results.back());

  const std::string candidate_name = CandidateName(cfg.candidate_binary);
  std::cerr << "[tokbench]   benchmarking " << candidate_name << "...\n";
  ProcessRunner process(cfg.candidate_binary, candidate_name);
  if (auto r = process.Run(text, rc)) {
    results.push_back(std::move(*r));
    log_throughput(results.back());
  } else {
    std::cerr << "[tokbench]     skipped (binary not found)\n";
  }
  return results;
}

std::string RenderReport(const BenchConfig& cfg, const std::vector<BenchmarkResult>& results) {
  if (cfg.format == OutputFormat::json) {
    RunMeta meta;
    meta.input_size = cfg.size;
    meta.input_bytes = cfg.size_bytes;
    meta.encoding = cfg.encoding;
    meta.iterations = cfg.iterations;
    meta.warmup = cfg.warmup;
    meta.seed = cfg.seed;
    return FormatJson(meta, results);
  }

  std::string out = FormatTable(results) + FormatComparisonSummary(results);
  if (cfg.detail) {
    for (const auto& r : results) {
      out += "\n\n" + FormatDetail(r);
    }
  }
  return out;
}

void EmitReport(const BenchConfig& cfg, const std::string& text) {
  if (cfg.output_path.empty()) {
    std::cout << "\n" << text << "\n";
    return;
  }
  std::ofstream out(cfg.output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open output file: " + cfg.output_path);
  }
  out << text << "\n";
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write output file: " + cfg.output_path);
  }
  std::cerr << "\n[tokbench] results written to " << cfg.output_path << "\n";
}

}  // namespace tokbench
