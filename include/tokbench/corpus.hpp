#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tokbench {

inline constexpr std::uint64_t kDefaultCorpusSeed = 42;

// Fixed ASCII word list: short, medium, long, technical and numeric entries.
[[nodiscard]] const std::vector<std::string_view>& CorpusVocabulary();

// Builds English-like text of exactly `size_bytes` bytes. Words are drawn
// uniformly from CorpusVocabulary() using `rng`, separated by single spaces;
// the final word is cut to fill the budget.
[[nodiscard]] std::string GenerateCorpus(std::size_t size_bytes, std::mt19937_64& rng);

// Same as above with a freshly seeded engine, so equal (size, seed) pairs
// always produce identical bytes.
[[nodiscard]] std::string GenerateCorpus(std::size_t size_bytes,
                                         std::uint64_t seed = kDefaultCorpusSeed);

}  // namespace tokbench
