#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tokbench/encoder.hpp"
#include "tokbench/result.hpp"

namespace tokbench {

struct RunConfig {
  std::string encoding = "o200k_base";
  std::uint64_t iterations = 100;
  std::uint64_t warmup = 10;
  // Progress lines on stderr during the timed phase; 0 disables them.
  std::uint64_t progress_interval_ms = 0;
};

// One way of invoking a tokenizer under warmup + timed loops. Every warmup
// invocation finishes before the first timed one starts.
class Runner {
 public:
  virtual ~Runner() = default;

  // std::nullopt means the implementation is unavailable and was skipped.
  // Throws std::invalid_argument when config.iterations is 0.
  [[nodiscard]] virtual std::optional<BenchmarkResult> Run(std::string_view text,
                                                           const RunConfig& config) const = 0;
  [[nodiscard]] virtual std::string_view Name() const = 0;
};

// Calls an Encoder in-process. Encoder exceptions propagate.
class LibraryRunner final : public Runner {
 public:
  explicit LibraryRunner(const Encoder& encoder, std::string name = "reference");

  [[nodiscard]] std::optional<BenchmarkResult> Run(std::string_view text,
                                                   const RunConfig& config) const override;
  [[nodiscard]] BenchmarkResult Measure(std::string_view text, const RunConfig& config) const;
  [[nodiscard]] std::string_view Name() const override { return name_; }

 private:
  const Encoder& encoder_;
  std::string name_;
};

// Spawns `<binary> count <file> --model <model>` once per iteration, so each
// sample includes process start-up. A missing binary is a skip; a non-zero
// exit throws ProcessError. The corpus file is removed on every exit path.
class ProcessRunner final : public Runner {
 public:
  explicit ProcessRunner(std::string binary_path, std::string name = "candidate");

  [[nodiscard]] std::optional<BenchmarkResult> Run(std::string_view text,
                                                   const RunConfig& config) const override;
  [[nodiscard]] std::string_view Name() const override { return name_; }

  [[nodiscard]] std::vector<std::string> BuildArgv(const std::string& input_path,
                                                   std::string_view encoding) const;
  [[nodiscard]] const std::string& binary_path() const noexcept { return binary_path_; }

 private:
  std::string binary_path_;
  std::string name_;
};

// cl100k_base -> gpt-4, o200k_base -> gpt-4o, anything else -> gpt-4o.
[[nodiscard]] std::string_view ModelForEncoding(std::string_view encoding);

// Reads the leading whitespace-delimited integer of a candidate's stdout
// ("1234 tokens" -> 1234). False for empty or non-numeric output.
bool ParseTokenCount(std::string_view output, std::uint64_t& out);

}  // namespace tokbench
