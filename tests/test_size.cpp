#include <cassert>
#include <cstdint>

#include "tokbench/size.hpp"

int main() {
  using namespace tokbench;

  std::uint64_t v = 0;
  assert(ParseSize("512", v) && v == 512);
  assert(ParseSize("1KB", v) && v == 1024);
  assert(ParseSize("10kb", v) && v == 10 * 1024);
  assert(ParseSize(" 1MB ", v) && v == 1024 * 1024);
  assert(ParseSize("1.5MB", v) && v == 1572864);
  assert(ParseSize("2GB", v) && v == 2ull * 1024 * 1024 * 1024);
  assert(ParseSize("100B", v) && v == 100);
  assert(ParseSize("0", v) && v == 0);

  v = 7;
  assert(!ParseSize("", v));
  assert(!ParseSize("MB", v));
  assert(!ParseSize("abc", v));
  assert(!ParseSize("-1KB", v));
  assert(!ParseSize("10XB", v));
  assert(v == 7);

  assert(FormatBytes(512) == "512 B");
  assert(FormatBytes(1024) == "1.00 KB");
  assert(FormatBytes(1536 * 1024) == "1.50 MB");
  return 0;
}
