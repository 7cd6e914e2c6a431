#include "tokbench/size.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace tokbench {

namespace {

std::string trim_upper(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  std::string out;
  out.reserve(end - start);
  for (std::size_t i = start; i < end; ++i) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(s[i]))));
  }
  return out;
}

bool parse_number(const std::string& s, double& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+') {
    return false;
  }
  try {
    std::size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(v)) {
      return false;
    }
    out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

bool ParseSize(const std::string& text, std::uint64_t& out) {
  // Longest suffix first so "KB" is not read as "B".
  static const std::array<std::pair<const char*, std::uint64_t>, 4> kSuffixes = {{
      {"GB", 1024ull * 1024 * 1024},
      {"MB", 1024ull * 1024},
      {"KB", 1024ull},
      {"B", 1ull},
  }};

  const std::string s = trim_upper(text);
  std::uint64_t multiplier = 1;
  std::string number = s;
  for (const auto& [suffix, mult] : kSuffixes) {
    const std::string suf(suffix);
    if (s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0) {
      number = trim_upper(s.substr(0, s.size() - suf.size()));
      multiplier = mult;
      break;
    }
  }

  double value = 0.0;
  if (!parse_number(number, value)) {
    return false;
  }
  const double bytes = std::floor(value * static_cast<double>(multiplier));
  if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(bytes);
  return true;
}

std::string FormatBytes(std::uint64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  if (unit == 0) {
    oss << bytes << " B";
  } else {
    oss << std::fixed << std::setprecision(2) << value << ' ' << kUnits[unit];
  }
  return oss.str();
}

}  // namespace tokbench
