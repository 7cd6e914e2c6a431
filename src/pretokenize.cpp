#include "tokbench/pretokenize.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>

namespace tokbench {

namespace {

enum class CharClass {
  kNewline,  // \r or \n
  kSpace,    // any other white space
  kUpper,
  kLower,
  kLetter,  // letter without ASCII case
  kDigit,
  kPunct,  // everything else
};

struct Unit {
  std::size_t pos;
  CharClass cls;
};

using Units = std::vector<Unit>;

std::uint32_t decode_at(std::string_view s, std::size_t i, std::size_t& len) {
  auto c = static_cast<unsigned char>(s[i]);
  auto cont = [&](std::size_t k) { return static_cast<std::uint32_t>(static_cast<unsigned char>(s[i + k]) & 0x3F); };
  if (c < 0x80) {
    len = 1;
    return c;
  }
  if ((c >> 5) == 0x6 && i + 1 < s.size()) {
    len = 2;
    return ((c & 0x1Fu) << 6) | cont(1);
  }
  if ((c >> 4) == 0xE && i + 2 < s.size()) {
    len = 3;
    return ((c & 0x0Fu) << 12) | (cont(1) << 6) | cont(2);
  }
  if ((c >> 3) == 0x1E && i + 3 < s.size()) {
    len = 4;
    return ((c & 0x07u) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3);
  }
  len = 1;
  return 0xFFFD;
}

bool is_space_cp(std::uint32_t cp) {
  if (cp <= 0x20) {
    return cp == 0x09 || cp == 0x0A || cp == 0x0B || cp == 0x0C || cp == 0x0D || cp == 0x20;
  }
  return cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
         cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

CharClass classify(std::uint32_t cp) {
  if (cp == '\r' || cp == '\n') return CharClass::kNewline;
  if (is_space_cp(cp)) return CharClass::kSpace;
  if (cp < 0x80) {
    if (cp >= 'A' && cp <= 'Z') return CharClass::kUpper;
    if (cp >= 'a' && cp <= 'z') return CharClass::kLower;
    if (cp >= '0' && cp <= '9') return CharClass::kDigit;
    return CharClass::kPunct;
  }
  // Latin-1 controls and symbols, general punctuation through misc symbols,
  // CJK punctuation, fullwidth ASCII punctuation, replacement character.
  if (cp <= 0xBF || cp == 0xD7 || cp == 0xF7 || (cp >= 0x2000 && cp <= 0x2BFF) ||
      (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFF01 && cp <= 0xFF0F) || cp == 0xFFFD) {
    return CharClass::kPunct;
  }
  return CharClass::kLetter;
}

Units scan(std::string_view text) {
  Units units;
  units.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t len = 1;
    auto cp = decode_at(text, i, len);
    units.push_back({i, classify(cp)});
    i += len;
  }
  return units;
}

bool is_letter(CharClass c) {
  return c == CharClass::kUpper || c == CharClass::kLower || c == CharClass::kLetter;
}
bool is_ws(CharClass c) {
  return c == CharClass::kSpace || c == CharClass::kNewline;
}
// [^\r\n\p{L}\p{N}]
bool is_word_prefix(CharClass c) {
  return c == CharClass::kSpace || c == CharClass::kPunct;
}
// [\p{Lu}\p{Lt}\p{Lm}\p{Lo}\p{M}]
bool in_upper_set(CharClass c) {
  return c == CharClass::kUpper || c == CharClass::kLetter;
}
// [\p{Ll}\p{Lm}\p{Lo}\p{M}]
bool in_lower_set(CharClass c) {
  return c == CharClass::kLower || c == CharClass::kLetter;
}

template <typename Pred>
std::size_t run_end(const Units& u, std::size_t k, Pred pred) {
  while (k < u.size() && pred(u[k].cls)) ++k;
  return k;
}

// Length in units of 's 't 're 've 'm 'll 'd (any case) at k, or 0.
std::size_t contraction_len(const Units& u, std::string_view text, std::size_t k) {
  if (k >= u.size() || text[u[k].pos] != '\'') return 0;
  auto lower_at = [&](std::size_t j) -> char {
    if (j >= u.size() || (u[j].cls != CharClass::kUpper && u[j].cls != CharClass::kLower)) return 0;
    return static_cast<char>(std::tolower(static_cast<unsigned char>(text[u[j].pos])));
  };
  const char a = lower_at(k + 1);
  const char b = lower_at(k + 2);
  if (a == 's' || a == 't' || a == 'm' || a == 'd') return 2;
  if ((a == 'r' && b == 'e') || (a == 'v' && b == 'e') || (a == 'l' && b == 'l')) return 3;
  return 0;
}

// Each matcher returns the end of its match starting at k, or k when it does
// not match.

// [^\r\n\p{L}\p{N}]?\p{L}+
std::size_t match_letters(const Units& u, std::size_t k) {
  std::size_t j = k;
  if (is_word_prefix(u[j].cls) && j + 1 < u.size() && is_letter(u[j + 1].cls)) ++j;
  if (!is_letter(u[j].cls)) return k;
  return run_end(u, j, is_letter);
}

// [^\r\n\p{L}\p{N}]?UPPER*LOWER+ or [^\r\n\p{L}\p{N}]?UPPER+LOWER*, each with
// an optional contraction suffix.
std::size_t match_cased_word(const Units& u, std::string_view text, std::size_t k) {
  std::size_t j = is_word_prefix(u[k].cls) ? k + 1 : k;
  const std::size_t upper_end = run_end(u, j, in_upper_set);
  const std::size_t lower_end = run_end(u, upper_end, in_lower_set);
  std::size_t end = k;
  if (lower_end > upper_end) {
    end = lower_end;
  } else {
    // UPPER* gives back its trailing caseless letters to satisfy LOWER+.
    for (std::size_t p = upper_end; p > j; --p) {
      if (u[p - 1].cls == CharClass::kLetter) {
        end = p;
        break;
      }
    }
    if (end == k && upper_end > j) {
      end = upper_end;
    }
  }
  if (end == k) return k;
  return end + contraction_len(u, text, end);
}

// \p{N}{1,3}
std::size_t match_digits(const Units& u, std::size_t k) {
  std::size_t j = k;
  while (j < u.size() && j - k < 3 && u[j].cls == CharClass::kDigit) ++j;
  return j;
}

// " ?[^\s\p{L}\p{N}]+[\r\n]*"; o200k also allows '/' in the tail, which the
// punctuation run has already taken.
std::size_t match_punct(const Units& u, std::string_view text, std::size_t k) {
  std::size_t j = k;
  if (text[u[j].pos] == ' ' && j + 1 < u.size() && u[j + 1].cls == CharClass::kPunct) ++j;
  if (u[j].cls != CharClass::kPunct) return k;
  j = run_end(u, j, [](CharClass c) { return c == CharClass::kPunct; });
  return run_end(u, j, [](CharClass c) { return c == CharClass::kNewline; });
}

// \s*[\r\n]+ | \s+(?!\S) | \s+
std::size_t match_whitespace(const Units& u, std::size_t k) {
  if (!is_ws(u[k].cls)) return k;
  std::size_t end = k;
  std::size_t last_newline = u.size();
  while (end < u.size() && is_ws(u[end].cls)) {
    if (u[end].cls == CharClass::kNewline) last_newline = end;
    ++end;
  }
  if (last_newline != u.size()) return last_newline + 1;
  // Leave the last space for the word that follows.
  if (end < u.size() && end - k > 1) return end - 1;
  return end;
}

std::vector<std::string_view> split_tiktoken(std::string_view text, SplitRule rule) {
  const Units u = scan(text);
  auto offset = [&](std::size_t k) { return k < u.size() ? u[k].pos : text.size(); };

  std::vector<std::string_view> out;
  std::size_t k = 0;
  while (k < u.size()) {
    std::size_t end = k;
    if (rule == SplitRule::kCl100k) {
      end = k + contraction_len(u, text, k);
      if (end == k) end = match_letters(u, k);
    } else {
      end = match_cased_word(u, text, k);
    }
    if (end == k) end = match_digits(u, k);
    if (end == k) end = match_punct(u, text, k);
    if (end == k) end = match_whitespace(u, k);
    if (end == k) end = k + 1;
    out.push_back(text.substr(offset(k), offset(end) - offset(k)));
    k = end;
  }
  return out;
}

bool is_space_byte(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  const std::size_t n = text.size();
  auto space_then_word = [&](std::size_t k) { return text[k] == ' ' && k + 1 < n && !is_space_byte(text[k + 1]); };
  while (i < n) {
    const std::size_t start = i;
    if (space_then_word(i)) {
      ++i;
      while (i < n && !is_space_byte(text[i])) ++i;
    } else if (is_space_byte(text[i])) {
      // A single space right before a word belongs to that word.
      while (i < n && is_space_byte(text[i]) && !space_then_word(i)) ++i;
    } else {
      while (i < n && !is_space_byte(text[i])) ++i;
    }
    out.push_back(text.substr(start, i - start));
  }
  return out;
}

}  // namespace

std::vector<std::string_view> SplitPieces(std::string_view text, SplitRule rule) {
  if (rule == SplitRule::kWhitespace) {
    return split_whitespace(text);
  }
  return split_tiktoken(text, rule);
}

SplitRule SplitRuleForEncoding(std::string_view encoding) {
  if (encoding == "cl100k_base") return SplitRule::kCl100k;
  if (encoding == "o200k_base") return SplitRule::kO200k;
  return SplitRule::kWhitespace;
}

}  // namespace tokbench
