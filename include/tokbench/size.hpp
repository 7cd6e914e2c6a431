#pragma once

#include <cstdint>
#include <string>

namespace tokbench {

// Parses "512", "1KB", "1.5MB", "2gb" into a byte count (binary multiples).
// Returns false for empty, negative or non-numeric input.
bool ParseSize(const std::string& text, std::uint64_t& out);

// Inverse used for log lines: 1048576 -> "1.00 MB".
[[nodiscard]] std::string FormatBytes(std::uint64_t bytes);

}  // namespace tokbench
