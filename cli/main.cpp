#include "tokbench/bench.hpp"
#include "tokbench/config.hpp"
#include "tokbench/encoder.hpp"

#include <exception>
#include <iostream>

using namespace tokbench;

int main(int argc, char** argv) {
  BenchConfig cfg;
  cfg.env_file = EnvFileFromArgs(argc, argv, cfg.env_file);
  ApplyEnvOverrides(cfg, ReadEnvFile(cfg.env_file));
  if (!ParseArgs(argc, argv, cfg)) {
    return 1;
  }
  if (cfg.help) {
    PrintUsage();
    return 0;
  }

  std::string err;
  if (!ValidateConfig(cfg, err)) {
    std::cerr << "error: " << err << "\n";
    return 1;
  }

  try {
    EncoderOptions eopts;
    eopts.backend = cfg.reference;
    eopts.tokenizer_dir = cfg.tokenizer_dir;
    auto reference = GetEncoder(cfg.encoding, eopts);

    auto results = RunBenchmarks(cfg, *reference);
    EmitReport(cfg, RenderReport(cfg, results));
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
