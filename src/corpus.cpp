#include "tokbench/corpus.hpp"

#include <limits>

namespace tokbench {

namespace {

// Index in [0, n) taken straight from the engine output with rejection, so the
// sequence depends only on mt19937_64 and not on the standard library's
// distribution algorithms.
std::size_t pick_index(std::mt19937_64& rng, std::size_t n) {
  const std::uint64_t bound = static_cast<std::uint64_t>(n);
  const std::uint64_t limit = (std::numeric_limits<std::uint64_t>::max() / bound) * bound;
  std::uint64_t v = rng();
  while (v >= limit) {
    v = rng();
  }
  return static_cast<std::size_t>(v % bound);
}

}  // namespace

const std::vector<std::string_view>& CorpusVocabulary() {
  static const std::vector<std::string_view> kWords = {
      // short
      "the", "a", "an", "is", "it", "to", "of", "in", "on", "at",
      "and", "or", "but", "not", "for", "with", "as", "by", "from",
      // medium
      "hello", "world", "this", "that", "have", "been", "will", "would",
      "could", "should", "about", "after", "before", "between", "through",
      "during", "within", "without", "because", "although", "however",
      // long
      "performance", "tokenization", "benchmark", "implementation",
      "optimization", "measurement", "comparison", "throughput",
      "processing", "algorithm", "application", "development",
      // technical
      "function", "variable", "parameter", "interface", "component",
      "structure", "encoding", "decoding", "compression", "analysis",
      // numbers and ordinals
      "100", "2024", "first", "second", "third", "example", "result",
  };
  return kWords;
}

std::string GenerateCorpus(std::size_t size_bytes, std::mt19937_64& rng) {
  const auto& words = CorpusVocabulary();

  std::string out;
  out.reserve(size_bytes);
  while (out.size() < size_bytes) {
    const std::string_view word = words[pick_index(rng, words.size())];
    const std::size_t sep = out.empty() ? 0 : 1;
    const std::size_t remaining = size_bytes - out.size();
    if (sep + word.size() > remaining) {
      if (sep == 1) {
        out.push_back(' ');
      }
      out.append(word.substr(0, remaining - sep));
      break;
    }
    if (sep == 1) {
      out.push_back(' ');
    }
    out.append(word);
  }
  return out;
}

std::string GenerateCorpus(std::size_t size_bytes, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  return GenerateCorpus(size_bytes, rng);
}

}  // namespace tokbench
