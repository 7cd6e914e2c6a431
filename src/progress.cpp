#include "tokbench/progress.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace tokbench {

std::string FormatDuration(double seconds) {
  if (seconds < 0.0) {
    seconds = 0.0;
  }
  auto total = static_cast<std::uint64_t>(seconds + 0.5);
  std::uint64_t h = total / 3600;
  std::uint64_t m = (total % 3600) / 60;
  std::uint64_t s = total % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
  return oss.str();
}

ProgressTracker::ProgressTracker(std::uint64_t total, std::string label, std::uint64_t interval_ms)
    : label_(std::move(label)), total_(total), interval_ms_(interval_ms) {
  start_ = std::chrono::steady_clock::now();
  last_print_ = start_;
}

void ProgressTracker::Add(std::uint64_t n) {
  done_ += n;
  MaybePrint(false);
}

void ProgressTracker::Finish() {
  // Short runs that never crossed the interval stay silent.
  if (printed_) {
    MaybePrint(true);
  }
}

void ProgressTracker::MaybePrint(bool force) {
  if (interval_ms_ == 0) {
    return;
  }
  auto now = std::chrono::steady_clock::now();
  if (!force) {
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_print_).count();
    if (delta < static_cast<long long>(interval_ms_)) {
      return;
    }
  }
  last_print_ = now;
  printed_ = true;

  double elapsed = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_).count();
  double rate = elapsed > 0.0 ? static_cast<double>(done_) / elapsed : 0.0;
  double pct = total_ > 0 ? 100.0 * static_cast<double>(done_) / static_cast<double>(total_) : 0.0;
  double eta = (rate > 0.0 && total_ > done_) ? static_cast<double>(total_ - done_) / rate : 0.0;

  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << "[" << label_ << "] " << done_ << "/" << total_ << " (" << std::setprecision(1) << pct << "%)";
  if (rate > 0.0) {
    oss << " rate " << std::setprecision(2) << rate << " it/s";
  }
  if (eta > 0.0) {
    oss << " ETA " << FormatDuration(eta);
  }
  oss << "\n";
  std::cerr << oss.str();
}

}  // namespace tokbench
