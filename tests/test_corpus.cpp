#include <cassert>
#include <cstddef>
#include <random>
#include <string>

#include "tokbench/corpus.hpp"

static bool is_ascii(const std::string& s) {
  for (unsigned char c : s) {
    if (c > 0x7F) return false;
  }
  return true;
}

int main() {
  using namespace tokbench;

  for (auto w : CorpusVocabulary()) {
    assert(!w.empty());
    assert(w.find(' ') == std::string_view::npos);
  }

  for (std::size_t size : {0u, 1u, 2u, 3u, 7u, 64u, 1000u, 4096u, 100000u}) {
    auto a = GenerateCorpus(size, 42);
    auto b = GenerateCorpus(size, 42);
    assert(a.size() == size);
    assert(a == b);
    assert(is_ascii(a));
    if (!a.empty()) {
      assert(a.front() != ' ');
      assert(a.find("  ") == std::string::npos);
    }
  }

  // Word choice depends only on the engine output, so these bytes are the
  // same with every standard library.
  assert(GenerateCorpus(80, 42) ==
         "this tokenization hello this result have will from function it comparison third ");
  assert(GenerateCorpus(25, 7) == "parameter with through fr");
  assert(CorpusVocabulary().size() == 69);

  // A smaller corpus is a prefix of a larger one for the same seed.
  auto small = GenerateCorpus(500, 7);
  auto large = GenerateCorpus(5000, 7);
  assert(large.compare(0, small.size(), small) == 0);

  assert(GenerateCorpus(4096, 1) != GenerateCorpus(4096, 2));

  // Explicit engines do not share state with each other.
  std::mt19937_64 r1(99);
  std::mt19937_64 r2(99);
  auto first = GenerateCorpus(2048, r1);
  auto unrelated = GenerateCorpus(333, r1);
  (void)unrelated;
  auto second = GenerateCorpus(2048, r2);
  assert(first == second);
  assert(first == GenerateCorpus(2048, 99));
  return 0;
}
