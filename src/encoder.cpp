#include "tokbench/encoder.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#ifdef TOKBENCH_WITH_TIKTOKEN
#include "tiktoken_encoder.hpp"
#endif

namespace tokbench {

namespace {

void append_utf8(std::uint32_t cp, std::string& out) {
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Printable bytes map to themselves, the rest to code points from 256 up.
std::vector<std::string> build_byte_to_unicode() {
  std::vector<std::string> out(256);
  std::uint32_t next = 256;
  for (std::uint32_t b = 0; b < 256; ++b) {
    const bool printable = (b >= 33 && b <= 126) || (b >= 161 && b <= 172) || (b >= 174 && b <= 255);
    append_utf8(printable ? b : next++, out[b]);
  }
  return out;
}

std::string merge_key(const std::string& a, const std::string& b) {
  return a + "\t" + b;
}

}  // namespace

ByteLevelBPEEncoder::ByteLevelBPEEncoder(std::string name, Vocab vocab, MergeRules merges,
                                         std::string unk_token, SplitRule split)
    : name_(std::move(name)),
      vocab_(std::move(vocab)),
      byte_to_unicode_(build_byte_to_unicode()),
      split_(split) {
  for (std::size_t i = 0; i < merges.size(); ++i) {
    merge_rank_.emplace(merge_key(merges[i].first, merges[i].second), i);
  }
  if (!unk_token.empty()) {
    auto it = vocab_.find(unk_token);
    if (it != vocab_.end()) {
      has_unk_ = true;
      unk_id_ = it->second;
    }
  }
}

ByteLevelBPEEncoder ByteLevelBPEEncoder::FromTokenizerJson(std::string name, const std::string& path,
                                                           SplitRule split) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open tokenizer json: " + path);
  }
  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.contains("model") || !j["model"].contains("vocab") ||
      !j["model"]["vocab"].is_object()) {
    throw std::runtime_error("malformed tokenizer json (model.vocab missing): " + path);
  }

  const auto& model = j["model"];
  Vocab vocab;
  vocab.reserve(model["vocab"].size());
  for (auto it = model["vocab"].begin(); it != model["vocab"].end(); ++it) {
    if (!it.value().is_number_unsigned() ||
        it.value().get<std::uint64_t>() > std::numeric_limits<TokenId>::max()) {
      throw std::runtime_error("malformed tokenizer json (bad id for '" + it.key() + "'): " + path);
    }
    vocab.emplace(it.key(), it.value().get<TokenId>());
  }

  MergeRules merges;
  if (model.contains("merges") && model["merges"].is_array()) {
    merges.reserve(model["merges"].size());
    for (const auto& m : model["merges"]) {
      // Older files store "a b", newer ones ["a", "b"].
      if (m.is_string()) {
        auto line = m.get<std::string>();
        auto pos = line.find(' ');
        if (pos == std::string::npos) continue;
        merges.emplace_back(line.substr(0, pos), line.substr(pos + 1));
      } else if (m.is_array() && m.size() == 2 && m[0].is_string() && m[1].is_string()) {
        merges.emplace_back(m[0].get<std::string>(), m[1].get<std::string>());
      }
    }
  }

  std::string unk;
  if (model.contains("unk_token") && model["unk_token"].is_string()) {
    unk = model["unk_token"].get<std::string>();
  }
  return ByteLevelBPEEncoder(std::move(name), std::move(vocab), std::move(merges), std::move(unk), split);
}

std::vector<std::string> ByteLevelBPEEncoder::ByteSymbols(std::string_view piece) const {
  std::vector<std::string> symbols;
  symbols.reserve(piece.size());
  for (unsigned char ch : piece) {
    symbols.push_back(byte_to_unicode_[ch]);
  }
  return symbols;
}

std::vector<std::string> ByteLevelBPEEncoder::ApplyMerges(std::vector<std::string> symbols) const {
  if (symbols.size() < 2 || merge_rank_.empty()) return symbols;
  while (symbols.size() > 1) {
    std::size_t best_rank = std::numeric_limits<std::size_t>::max();
    std::size_t best_idx = symbols.size();
    for (std::size_t i = 0; i + 1 < symbols.size(); ++i) {
      auto it = merge_rank_.find(merge_key(symbols[i], symbols[i + 1]));
      if (it != merge_rank_.end() && it->second < best_rank) {
        best_rank = it->second;
        best_idx = i;
      }
    }
    if (best_idx == symbols.size()) break;
    symbols[best_idx] += symbols[best_idx + 1];
    symbols.erase(symbols.begin() + static_cast<std::ptrdiff_t>(best_idx + 1));
  }
  return symbols;
}

void ByteLevelBPEEncoder::AppendIds(const std::vector<std::string>& symbols, std::vector<TokenId>& out) const {
  for (const auto& sym : symbols) {
    auto it = vocab_.find(sym);
    if (it != vocab_.end()) {
      out.push_back(it->second);
    } else if (has_unk_) {
      out.push_back(unk_id_);
    } else {
      throw std::runtime_error("symbol missing from vocabulary of " + name_ + ": '" + sym + "'");
    }
  }
}

std::vector<TokenId> ByteLevelBPEEncoder::Encode(std::string_view text) const {
  std::vector<TokenId> ids;
  ids.reserve(text.size() / 3 + 1);
  for (auto piece : SplitPieces(text, split_)) {
    AppendIds(ApplyMerges(ByteSymbols(piece)), ids);
  }
  return ids;
}

const std::vector<std::string>& SupportedEncodings() {
  static const std::vector<std::string> kEncodings = {"cl100k_base", "o200k_base"};
  return kEncodings;
}

bool IsSupportedEncoding(std::string_view encoding) {
  const auto& all = SupportedEncodings();
  return std::find(all.begin(), all.end(), encoding) != all.end();
}

bool ParseReferenceBackend(const std::string& text, ReferenceBackend& out) {
  std::string v;
  v.reserve(text.size());
  for (char c : text) {
    v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (v == "bpe" || v == "byte_bpe" || v == "byte-bpe") {
    out = ReferenceBackend::kBpe;
    return true;
  }
  if (v == "tiktoken") {
    out = ReferenceBackend::kTiktoken;
    return true;
  }
  return false;
}

bool TiktokenAvailable() {
#ifdef TOKBENCH_WITH_TIKTOKEN
  return true;
#else
  return false;
#endif
}

ReferenceBackend DefaultReferenceBackend() {
  return TiktokenAvailable() ? ReferenceBackend::kTiktoken : ReferenceBackend::kBpe;
}

std::string_view ReferenceBackendName(ReferenceBackend backend) {
  switch (backend) {
    case ReferenceBackend::kBpe:
      return "bpe";
    case ReferenceBackend::kTiktoken:
      return "tiktoken";
  }
  return "unknown";
}

std::unique_ptr<Encoder> GetEncoder(const std::string& encoding, const EncoderOptions& options) {
  if (!IsSupportedEncoding(encoding)) {
    throw std::invalid_argument("unsupported encoding: " + encoding);
  }
  switch (options.backend) {
    case ReferenceBackend::kBpe: {
      auto path = (std::filesystem::path(options.tokenizer_dir) / (encoding + ".json")).string();
      return std::make_unique<ByteLevelBPEEncoder>(
          ByteLevelBPEEncoder::FromTokenizerJson(encoding, path, SplitRuleForEncoding(encoding)));
    }
    case ReferenceBackend::kTiktoken:
#ifdef TOKBENCH_WITH_TIKTOKEN
      return MakeTiktokenEncoder(encoding);
#else
      throw std::runtime_error("tiktoken backend unavailable: tokbench was built without pybind11");
#endif
  }
  throw std::invalid_argument("unknown reference backend");
}

}  // namespace tokbench
