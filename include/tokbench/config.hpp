#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "tokbench/encoder.hpp"

namespace tokbench
{

enum class OutputFormat
{
    table = 0,
    json
};

struct BenchConfig
{
    std::string env_file = ".env";
    std::string size = "1MB";
    std::uint64_t size_bytes = 0; // resolved from `size` by ValidateConfig
    std::uint64_t iterations = 100;
    std::string encoding = "o200k_base";
    std::uint64_t warmup = 10;
    OutputFormat format = OutputFormat::table;
    std::string output_path; // empty -> stdout
    std::string candidate_binary = "./zig-out/bin/llm-cost";
    ReferenceBackend reference = DefaultReferenceBackend();
    std::string tokenizer_dir = "tokenizers";
    std::uint64_t seed = 42;
    std::uint64_t progress_interval_ms = 1000; // 0 -> silent
    bool detail = false;
    bool help = false;
};

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string &path);
void ApplyEnvOverrides(BenchConfig &cfg, const std::unordered_map<std::string, std::string> &env);

// Value of --env-file if present, otherwise `fallback`. Lets the .env layer be
// applied before the remaining flags override it.
std::string EnvFileFromArgs(int argc, char **argv, const std::string &fallback);

void PrintUsage();
bool ParseArgs(int argc, char **argv, BenchConfig &cfg);

// Resolves size_bytes and checks ranges; false with `err` set on bad input.
bool ValidateConfig(BenchConfig &cfg, std::string &err);

bool ParseOutputFormat(const std::string &s, OutputFormat &out);

} // namespace tokbench
