#include "tokbench/config.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "tokbench/size.hpp"

namespace tokbench
{

static std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

static std::string to_lower(const std::string &s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return v;
}

static bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        std::uint64_t v = static_cast<std::uint64_t>(std::stoull(s, &pos, 10));
        if (pos != s.size())
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

static bool parse_bool(const std::string &s, bool def_val)
{
    std::string v = to_lower(trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on")
    {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off")
    {
        return false;
    }
    return def_val;
}

static std::uint64_t parse_u64_or(const std::string &key, const std::string &s, std::uint64_t def_val)
{
    std::uint64_t v = 0;
    if (!parse_u64(trim(s), v))
    {
        std::cerr << "warning: ignoring invalid " << key << "=" << s << "\n";
        return def_val;
    }
    return v;
}

// One "KEY=VALUE" line, optionally prefixed with "export ". Quoted values are
// taken verbatim; unquoted ones end at a " #" comment.
static bool parse_env_line(const std::string &line, std::string &key, std::string &val)
{
    std::string body = trim(line);
    if (body.compare(0, 7, "export ") == 0)
    {
        body = trim(body.substr(7));
    }
    auto eq = body.find('=');
    if (eq == std::string::npos || eq == 0)
    {
        return false;
    }
    key = trim(body.substr(0, eq));
    if (key.empty() || key.find_first_of(" \t") != std::string::npos)
    {
        return false;
    }
    val = trim(body.substr(eq + 1));
    if (!val.empty() && (val.front() == '"' || val.front() == '\''))
    {
        auto close = val.find(val.front(), 1);
        if (close == std::string::npos)
        {
            return false;
        }
        val = val.substr(1, close - 1);
        return true;
    }
    auto hash = val.find(" #");
    if (hash != std::string::npos)
    {
        val = trim(val.substr(0, hash));
    }
    return true;
}

std::unordered_map<std::string, std::string> ReadEnvFile(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    std::size_t line_no = 0;
    std::string line;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
        {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        std::string key;
        std::string val;
        if (!parse_env_line(trimmed, key, val))
        {
            std::cerr << "warning: " << path << ":" << line_no << ": ignoring malformed line\n";
            continue;
        }
        env[key] = val;
    }
    return env;
}

void ApplyEnvOverrides(BenchConfig &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("BENCH_SIZE"))
        cfg.size = *v;
    if (auto v = get("BENCH_ITERATIONS"))
        cfg.iterations = parse_u64_or("BENCH_ITERATIONS", *v, cfg.iterations);
    if (auto v = get("BENCH_ENCODING"))
        cfg.encoding = *v;
    if (auto v = get("BENCH_WARMUP"))
        cfg.warmup = parse_u64_or("BENCH_WARMUP", *v, cfg.warmup);
    if (auto v = get("BENCH_FORMAT"))
    {
        if (!ParseOutputFormat(*v, cfg.format))
        {
            std::cerr << "warning: ignoring invalid BENCH_FORMAT=" << *v << "\n";
        }
    }
    if (auto v = get("BENCH_OUTPUT"))
        cfg.output_path = *v;
    if (auto v = get("BENCH_SEED"))
        cfg.seed = parse_u64_or("BENCH_SEED", *v, cfg.seed);
    if (auto v = get("BENCH_DETAIL"))
        cfg.detail = parse_bool(*v, cfg.detail);
    if (auto v = get("CANDIDATE_BINARY"))
        cfg.candidate_binary = *v;
    if (auto v = get("REFERENCE_BACKEND"))
    {
        if (!ParseReferenceBackend(*v, cfg.reference))
        {
            std::cerr << "warning: ignoring invalid REFERENCE_BACKEND=" << *v << "\n";
        }
    }
    if (auto v = get("TOKENIZER_DIR"))
        cfg.tokenizer_dir = *v;
    if (auto v = get("PROGRESS_INTERVAL_MS"))
        cfg.progress_interval_ms = parse_u64_or("PROGRESS_INTERVAL_MS", *v, cfg.progress_interval_ms);
}

std::string EnvFileFromArgs(int argc, char **argv, const std::string &fallback)
{
    std::string out = fallback;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--env-file")
        {
            out = argv[i + 1];
        }
    }
    return out;
}

bool ParseOutputFormat(const std::string &s, OutputFormat &out)
{
    std::string v = to_lower(trim(s));
    if (v == "table")
    {
        out = OutputFormat::table;
        return true;
    }
    if (v == "json")
    {
        out = OutputFormat::json;
        return true;
    }
    return false;
}

void PrintUsage()
{
    std::cerr << "tokbench: benchmark a candidate tokenizer binary against an in-process reference\n"
              << "Usage:\n"
              << "  tokbench [options]\n\n"
              << "Options:\n"
              << "  --env-file <path>             Path to .env (default: .env)\n"
              << "  --size <size>                 Corpus size, e.g. 1KB, 10KB, 1MB (default: 1MB)\n"
              << "  --iterations <n>              Timed iterations, >= 1 (default: 100)\n"
              << "  --encoding <name>             cl100k_base | o200k_base (default: o200k_base)\n"
              << "  --warmup <n>                  Warmup iterations (default: 10)\n"
              << "  --format <table|json>         Report format (default: table)\n"
              << "  --json                        Same as --format json\n"
              << "  --output <path>               Write the report to a file instead of stdout\n"
              << "  --candidate <path>            Candidate binary (default: ./zig-out/bin/llm-cost)\n"
              << "  --llm-cost <path>             Alias of --candidate\n"
              << "  --reference <bpe|tiktoken>    Reference backend (default: "
              << ReferenceBackendName(DefaultReferenceBackend()) << ")\n"
              << "                                tiktoken gives exact counts; bpe approximates them from\n"
              << "                                a local tokenizer.json"
              << (TiktokenAvailable() ? "" : " (tiktoken: not built in)") << "\n"
              << "  --tokenizer-dir <path>        Directory with <encoding>.json for bpe (default: tokenizers)\n"
              << "  --seed <n>                    Corpus seed (default: 42)\n"
              << "  --progress-interval-ms <n>    Progress line cadence, 0=off (default: 1000)\n"
              << "  --detail                      Print a latency breakdown per implementation\n"
              << "  --help                        Show this help\n";
}

bool ParseArgs(int argc, char **argv, BenchConfig &cfg)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto need_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };
        auto need_u64 = [&](const std::string &name, std::uint64_t &out) -> bool {
            const char *v = need_value(name);
            if (!v)
            {
                return false;
            }
            if (!parse_u64(v, out))
            {
                std::cerr << "Invalid " << name << ": " << v << "\n";
                return false;
            }
            return true;
        };
        auto need_string = [&](const std::string &name, std::string &out) -> bool {
            const char *v = need_value(name);
            if (!v)
            {
                return false;
            }
            out = v;
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            cfg.help = true;
            return true;
        }
        if (arg == "--")
        {
            continue;
        }
        if (arg == "--env-file")
        {
            if (!need_string(arg, cfg.env_file))
            {
                return false;
            }
            continue;
        }
        if (arg == "--size")
        {
            if (!need_string(arg, cfg.size))
            {
                return false;
            }
            continue;
        }
        if (arg == "--iterations")
        {
            if (!need_u64(arg, cfg.iterations))
            {
                return false;
            }
            continue;
        }
        if (arg == "--encoding")
        {
            if (!need_string(arg, cfg.encoding))
            {
                return false;
            }
            continue;
        }
        if (arg == "--warmup")
        {
            if (!need_u64(arg, cfg.warmup))
            {
                return false;
            }
            continue;
        }
        if (arg == "--format")
        {
            const char *v = need_value(arg);
            if (!v)
            {
                return false;
            }
            if (!ParseOutputFormat(v, cfg.format))
            {
                std::cerr << "Invalid --format: " << v << " (expected table or json)\n";
                return false;
            }
            continue;
        }
        if (arg == "--json")
        {
            cfg.format = OutputFormat::json;
            continue;
        }
        if (arg == "--output")
        {
            if (!need_string(arg, cfg.output_path))
            {
                return false;
            }
            continue;
        }
        if (arg == "--candidate" || arg == "--llm-cost")
        {
            if (!need_string(arg, cfg.candidate_binary))
            {
                return false;
            }
            continue;
        }
        if (arg == "--reference")
        {
            const char *v = need_value(arg);
            if (!v)
            {
                return false;
            }
            if (!ParseReferenceBackend(v, cfg.reference))
            {
                std::cerr << "Invalid --reference: " << v << " (expected bpe or tiktoken)\n";
                return false;
            }
            continue;
        }
        if (arg == "--tokenizer-dir")
        {
            if (!need_string(arg, cfg.tokenizer_dir))
            {
                return false;
            }
            continue;
        }
        if (arg == "--seed")
        {
            if (!need_u64(arg, cfg.seed))
            {
                return false;
            }
            continue;
        }
        if (arg == "--progress-interval-ms")
        {
            if (!need_u64(arg, cfg.progress_interval_ms))
            {
                return false;
            }
            continue;
        }
        if (arg == "--detail")
        {
            cfg.detail = true;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        PrintUsage();
        return false;
    }
    return true;
}

bool ValidateConfig(BenchConfig &cfg, std::string &err)
{
    std::uint64_t bytes = 0;
    if (!ParseSize(cfg.size, bytes))
    {
        err = "invalid size: '" + cfg.size + "' (expected e.g. 1KB, 10MB)";
        return false;
    }
    if (cfg.iterations == 0)
    {
        err = "iterations must be at least 1";
        return false;
    }
    if (!IsSupportedEncoding(cfg.encoding))
    {
        std::ostringstream oss;
        oss << "unsupported encoding: " << cfg.encoding << " (choose from";
        for (const auto &e : SupportedEncodings())
        {
            oss << " " << e;
        }
        oss << ")";
        err = oss.str();
        return false;
    }
    cfg.size_bytes = bytes;
    return true;
}

} // namespace tokbench
