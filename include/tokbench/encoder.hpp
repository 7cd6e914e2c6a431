#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tokbench/pretokenize.hpp"

namespace tokbench {

using TokenId = std::uint32_t;

// In-process reference tokenizer. Only the number of ids returned by Encode
// feeds the benchmark; implementations may throw on failure.
class Encoder {
 public:
  virtual ~Encoder() = default;

  [[nodiscard]] virtual std::vector<TokenId> Encode(std::string_view text) const = 0;
  [[nodiscard]] virtual std::string_view Name() const = 0;
};

using Vocab = std::unordered_map<std::string, TokenId>;
using MergeRules = std::vector<std::pair<std::string, std::string>>;

// Byte-level BPE: text is cut into pieces by `split`, each byte is mapped to
// its printable stand-in, then merges apply by rank within each piece. With a
// cl100k/o200k vocabulary and the matching SplitRule the counts approximate
// tiktoken; see SplitPieces for where they can differ.
class ByteLevelBPEEncoder final : public Encoder {
 public:
  ByteLevelBPEEncoder(std::string name, Vocab vocab, MergeRules merges,
                      std::string unk_token = {}, SplitRule split = SplitRule::kWhitespace);

  // Loads model.vocab / model.merges from a Hugging Face tokenizer.json.
  // Throws std::runtime_error when the file is missing or malformed.
  static ByteLevelBPEEncoder FromTokenizerJson(std::string name, const std::string& path,
                                               SplitRule split = SplitRule::kWhitespace);

  [[nodiscard]] std::vector<TokenId> Encode(std::string_view text) const override;
  [[nodiscard]] std::string_view Name() const override { return name_; }

  [[nodiscard]] std::size_t VocabSize() const { return vocab_.size(); }
  [[nodiscard]] std::size_t MergeCount() const { return merge_rank_.size(); }
  [[nodiscard]] SplitRule Split() const { return split_; }

 private:
  [[nodiscard]] std::vector<std::string> ByteSymbols(std::string_view piece) const;
  [[nodiscard]] std::vector<std::string> ApplyMerges(std::vector<std::string> symbols) const;
  void AppendIds(const std::vector<std::string>& symbols, std::vector<TokenId>& out) const;

  std::string name_;
  Vocab vocab_;
  std::unordered_map<std::string, std::size_t> merge_rank_;
  std::vector<std::string> byte_to_unicode_;
  bool has_unk_ = false;
  TokenId unk_id_ = 0;
  SplitRule split_ = SplitRule::kWhitespace;
};

enum class ReferenceBackend {
  kBpe = 0,   // local tokenizer.json, approximate counts
  kTiktoken,  // the tiktoken package, exact counts
};

// True when tokbench was built with the embedded tiktoken backend.
[[nodiscard]] bool TiktokenAvailable();

// kTiktoken when available, otherwise kBpe.
[[nodiscard]] ReferenceBackend DefaultReferenceBackend();

struct EncoderOptions {
  ReferenceBackend backend = DefaultReferenceBackend();
  // Directory holding <encoding>.json for the bpe backend.
  std::string tokenizer_dir = "tokenizers";
};

[[nodiscard]] const std::vector<std::string>& SupportedEncodings();
[[nodiscard]] bool IsSupportedEncoding(std::string_view encoding);

bool ParseReferenceBackend(const std::string& text, ReferenceBackend& out);
[[nodiscard]] std::string_view ReferenceBackendName(ReferenceBackend backend);

// Resolves the reference encoder for `encoding`. Throws std::invalid_argument
// for unsupported encodings and std::runtime_error when the backend cannot be
// loaded.
[[nodiscard]] std::unique_ptr<Encoder> GetEncoder(const std::string& encoding,
                                                  const EncoderOptions& options = {});

}  // namespace tokbench
