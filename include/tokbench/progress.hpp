#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tokbench {

// Throttled "[label] done/total" lines on stderr. An interval of 0 disables
// output entirely.
class ProgressTracker {
 public:
  ProgressTracker(std::uint64_t total, std::string label, std::uint64_t interval_ms);

  void Add(std::uint64_t n = 1);
  void Finish();

 private:
  void MaybePrint(bool force);

  std::string label_;
  std::uint64_t total_ = 0;
  std::uint64_t done_ = 0;
  std::uint64_t interval_ms_ = 1000;
  bool printed_ = false;
  std::chrono::steady_clock::time_point start_;
  std::chrono::steady_clock::time_point last_print_;
};

// "hh:mm:ss"
[[nodiscard]] std::string FormatDuration(double seconds);

}  // namespace tokbench
