#pragma once

#include <string>
#include <vector>

#include "tokbench/config.hpp"
#include "tokbench/encoder.hpp"
#include "tokbench/result.hpp"

namespace tokbench {

// Generates the corpus, runs the reference then the candidate (strictly one
// after the other) and returns the results in that order. The candidate is
// left out when its binary is missing. `cfg` must have passed ValidateConfig.
[[nodiscard]] std::vector<BenchmarkResult> RunBenchmarks(const BenchConfig& cfg, const Encoder& reference);

// Table (+ comparison summary, + per-result detail when cfg.detail) or JSON.
[[nodiscard]] std::string RenderReport(const BenchConfig& cfg, const std::vector<BenchmarkResult>& results);

// Writes `text` to cfg.output_path, or stdout when it is empty. Throws
// std::runtime_error when the file cannot be written.
void EmitReport(const BenchConfig& cfg, const std::string& text);

// Display name for a candidate binary: its file name ("llm-cost").
[[nodiscard]] std::string CandidateName(const std::string& binary_path);

}  // namespace tokbench
