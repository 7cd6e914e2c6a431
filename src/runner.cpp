#include "tokbench/runner.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "tokbench/process.hpp"
#include "tokbench/progress.hpp"

namespace tokbench {

namespace {

using Clock = std::chrono::steady_clock;

std::uint64_t elapsed_ns(Clock::time_point start, Clock::time_point stop) {
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(stop - start).count();
  return ns > 0 ? static_cast<std::uint64_t>(ns) : 0;
}

void require_iterations(const RunConfig& config) {
  if (config.iterations == 0) {
    throw std::invalid_argument("iterations must be at least 1");
  }
}

bool is_file(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

LibraryRunner::LibraryRunner(const Encoder& encoder, std::string name)
    : encoder_(encoder), name_(std::move(name)) {}

std::optional<BenchmarkResult> LibraryRunner::Run(std::string_view text, const RunConfig& config) const {
  return Measure(text, config);
}

BenchmarkResult LibraryRunner::Measure(std::string_view text, const RunConfig& config) const {
  require_iterations(config);

  for (std::uint64_t i = 0; i < config.warmup; ++i) {
    auto ids = encoder_.Encode(text);
    (void)ids;
  }

  BenchmarkResult result;
  result.name = name_;
  result.encoding = config.encoding;
  result.input_bytes = text.size();
  result.iterations = config.iterations;
  result.times_ns.reserve(config.iterations);

  ProgressTracker progress(config.iterations, name_, config.progress_interval_ms);
  for (std::uint64_t i = 0; i < config.iterations; ++i) {
    auto start = Clock::now();
    auto ids = encoder_.Encode(text);
    auto stop = Clock::now();
    result.times_ns.push_back(elapsed_ns(start, stop));
    if (i == 0) {
      result.tokens = ids.size();
    }
    progress.Add();
  }
  progress.Finish();
  return result;
}

ProcessRunner::ProcessRunner(std::string binary_path, std::string name)
    : binary_path_(std::move(binary_path)), name_(std::move(name)) {}

std::vector<std::string> ProcessRunner::BuildArgv(const std::string& input_path, std::string_view encoding) const {
  return {binary_path_, "count", input_path, "--model", std::string(ModelForEncoding(encoding))};
}

std::optional<BenchmarkResult> ProcessRunner::Run(std::string_view text, const RunConfig& config) const {
  require_iterations(config);
  if (!is_file(binary_path_)) {
    std::cerr << "warning: " << name_ << " binary not found at " << binary_path_ << "\n";
    return std::nullopt;
  }

  TempFile input(text);
  const auto argv = BuildArgv(input.path(), config.encoding);

  for (std::uint64_t i = 0; i < config.warmup; ++i) {
    RunChecked(argv);
  }

  BenchmarkResult result;
  result.name = name_;
  result.encoding = config.encoding;
  result.input_bytes = text.size();
  result.iterations = config.iterations;
  result.times_ns.reserve(config.iterations);

  ProgressTracker progress(config.iterations, name_, config.progress_interval_ms);
  for (std::uint64_t i = 0; i < config.iterations; ++i) {
    auto start = Clock::now();
    auto out = RunChecked(argv);
    auto stop = Clock::now();
    result.times_ns.push_back(elapsed_ns(start, stop));
    if (i == 0 && !ParseTokenCount(out.stdout_text, result.tokens)) {
      std::cerr << "warning: could not parse token count from " << name_ << " output; using 0\n";
      result.tokens = 0;
    }
    progress.Add();
  }
  progress.Finish();

  input.Remove();
  return result;
}

std::string_view ModelForEncoding(std::string_view encoding) {
  static constexpr std::array<std::pair<std::string_view, std::string_view>, 2> kModels = {{
      {"cl100k_base", "gpt-4"},
      {"o200k_base", "gpt-4o"},
  }};
  for (const auto& [enc, model] : kModels) {
    if (enc == encoding) {
      return model;
    }
  }
  return "gpt-4o";
}

bool ParseTokenCount(std::string_view output, std::uint64_t& out) {
  std::size_t i = 0;
  while (i < output.size() && std::isspace(static_cast<unsigned char>(output[i]))) ++i;
  std::size_t j = i;
  while (j < output.size() && !std::isspace(static_cast<unsigned char>(output[j]))) ++j;
  if (i == j) {
    return false;
  }
  std::uint64_t value = 0;
  const char* first = output.data() + i;
  const char* last = output.data() + j;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace tokbench
