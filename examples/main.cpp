#include <exception>
#include <iostream>
#include <string>

#include "tokbench/corpus.hpp"
#include "tokbench/encoder.hpp"
#include "tokbench/report.hpp"
#include "tokbench/runner.hpp"

// Times a tokenizer.json-backed encoder on a 64KB corpus:
//   tokbench_example path/to/o200k_base.json [o200k_base]
int main(int argc, char** argv) {
  using namespace tokbench;

  if (argc < 2) {
    std::cerr << "Usage: tokbench_example <tokenizer.json> [encoding]\n";
    return 1;
  }

  try {
    const std::string encoding = argc > 2 ? argv[2] : "o200k_base";
    auto encoder = ByteLevelBPEEncoder::FromTokenizerJson(encoding, argv[1], SplitRuleForEncoding(encoding));
    auto text = GenerateCorpus(64 * 1024);

    RunConfig cfg;
    cfg.iterations = 20;
    cfg.warmup = 2;
    cfg.encoding = encoding;
    LibraryRunner runner(encoder, encoding);
    std::cout << FormatDetail(runner.Measure(text, cfg));
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
