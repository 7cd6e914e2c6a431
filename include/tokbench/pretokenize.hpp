#pragma once

#include <string_view>
#include <vector>

namespace tokbench {

// How text is cut into pieces before byte-level merges run on each piece.
enum class SplitRule {
  kWhitespace = 0,  // words carry one leading space (GPT-2 style)
  kCl100k,          // cl100k_base split pattern
  kO200k,           // o200k_base split pattern
};

// Splits `text` into pieces that concatenate back to `text`.
//
// kCl100k and kO200k follow the tiktoken split patterns: contractions, letter
// runs with one optional leading non-letter, digit groups of at most three,
// punctuation runs with an optional leading space, and the three whitespace
// rules. ASCII is classified exactly. Outside ASCII every non-space code point
// that is not in a punctuation or symbol block counts as a caseless letter, so
// counts on non-Latin text may differ from tiktoken.
[[nodiscard]] std::vector<std::string_view> SplitPieces(std::string_view text,
                                                        SplitRule rule = SplitRule::kWhitespace);

// kCl100k for cl100k_base, kO200k for o200k_base, kWhitespace otherwise.
[[nodiscard]] SplitRule SplitRuleForEncoding(std::string_view encoding);

}  // namespace tokbench
