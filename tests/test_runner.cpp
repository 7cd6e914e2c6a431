#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "tokbench/process.hpp"
#include "tokbench/runner.hpp"

namespace fs = std::filesystem;

namespace {

class CountingEncoder final : public tokbench::Encoder {
 public:
  std::vector<tokbench::TokenId> Encode(std::string_view text) const override {
    ++calls;
    std::vector<tokbench::TokenId> ids;
    bool in_word = false;
    for (char c : text) {
      if (c == ' ') {
        in_word = false;
      } else if (!in_word) {
        in_word = true;
        ids.push_back(static_cast<tokbench::TokenId>(ids.size()));
      }
    }
    return ids;
  }
  std::string_view Name() const override { return "counting"; }

  mutable int calls = 0;
};

class FailingEncoder final : public tokbench::Encoder {
 public:
  explicit FailingEncoder(int fail_at) : fail_at_(fail_at) {}
  std::vector<tokbench::TokenId> Encode(std::string_view) const override {
    if (++calls_ >= fail_at_) {
      throw std::runtime_error("encoder exploded");
    }
    return {1, 2, 3};
  }
  std::string_view Name() const override { return "failing"; }

 private:
  int fail_at_;
  mutable int calls_ = 0;
};

fs::path g_root;
fs::path g_tmp;

std::size_t tmp_entries() {
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(g_tmp), fs::directory_iterator{}));
}

std::string write_script(const std::string& name, const std::string& body) {
  auto path = g_root / "bin" / name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
  }
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
  return path.string();
}

std::string read_all(const fs::path& p) {
  std::ifstream in(p);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Runs `fn` with fd 2 pointed at a file and returns what landed there.
template <typename Fn>
std::string capture_stderr(Fn fn) {
  auto path = g_root / "stderr.capture";
  std::cerr.flush();
  int saved = ::dup(STDERR_FILENO);
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  assert(saved >= 0 && fd >= 0);
  ::dup2(fd, STDERR_FILENO);
  ::close(fd);
  fn();
  std::cerr.flush();
  ::dup2(saved, STDERR_FILENO);
  ::close(saved);
  return read_all(path);
}

void setup() {
  g_root = fs::temp_directory_path() / ("tokbench-runner-test-" + std::to_string(::getpid()));
  fs::remove_all(g_root);
  g_tmp = g_root / "tmp";
  fs::create_directories(g_tmp);
  fs::create_directories(g_root / "bin");
  // TempFile goes through temp_directory_path(), which honours TMPDIR.
  ::setenv("TMPDIR", g_tmp.c_str(), 1);
  assert(fs::equivalent(fs::temp_directory_path(), g_tmp));
}

}  // namespace

static void test_helpers() {
  using namespace tokbench;
  assert(ModelForEncoding("cl100k_base") == "gpt-4");
  assert(ModelForEncoding("o200k_base") == "gpt-4o");
  assert(ModelForEncoding("p50k_base") == "gpt-4o");

  std::uint64_t n = 99;
  assert(ParseTokenCount("1234", n) && n == 1234);
  assert(ParseTokenCount("  1234 tokens\n", n) && n == 1234);
  assert(ParseTokenCount("0\n", n) && n == 0);
  n = 99;
  assert(!ParseTokenCount("", n));
  assert(!ParseTokenCount("   \n", n));
  assert(!ParseTokenCount("tokens: 12", n));
  assert(!ParseTokenCount("12abc", n));
  assert(!ParseTokenCount("-5", n));
  assert(n == 99);

  ProcessRunner runner("/opt/llm-cost", "llm-cost");
  auto argv = runner.BuildArgv("/tmp/in.txt", "cl100k_base");
  assert((argv == std::vector<std::string>{"/opt/llm-cost", "count", "/tmp/in.txt", "--model", "gpt-4"}));
}

static void test_library_runner() {
  using namespace tokbench;
  CountingEncoder enc;
  LibraryRunner runner(enc, "counting");
  RunConfig cfg;
  cfg.encoding = "cl100k_base";
  cfg.iterations = 7;
  cfg.warmup = 3;

  auto r = runner.Run("one two three four", cfg);
  assert(r.has_value());
  assert(enc.calls == 10);
  assert(r->name == "counting");
  assert(r->encoding == "cl100k_base");
  assert(r->input_bytes == 18);
  assert(r->iterations == 7);
  assert(r->times_ns.size() == 7);
  assert(r->tokens == 4);

  cfg.warmup = 0;
  cfg.iterations = 1;
  auto single = runner.Measure("x", cfg);
  assert(single.times_ns.size() == 1 && single.tokens == 1);

  cfg.iterations = 0;
  bool threw = false;
  try {
    (void)runner.Measure("x", cfg);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

static void test_library_runner_propagates() {
  using namespace tokbench;
  RunConfig cfg;
  cfg.iterations = 5;
  cfg.warmup = 2;

  // Fails during warmup.
  FailingEncoder warm(2);
  bool threw = false;
  try {
    (void)LibraryRunner(warm).Measure("text", cfg);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  // Fails during the timed phase.
  FailingEncoder timed(5);
  threw = false;
  try {
    (void)LibraryRunner(timed).Measure("text", cfg);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

static void test_process_runner_missing_binary() {
  using namespace tokbench;
  ProcessRunner runner((g_root / "bin" / "does-not-exist").string(), "llm-cost");
  RunConfig cfg;
  cfg.iterations = 3;
  cfg.warmup = 1;
  auto r = runner.Run("hello world", cfg);
  assert(!r.has_value());
  assert(tmp_entries() == 0);

  // A directory is not a runnable file either.
  ProcessRunner dir_runner((g_root / "bin").string());
  assert(!dir_runner.Run("hello world", cfg).has_value());
  assert(tmp_entries() == 0);
}

static void test_process_runner_success() {
  using namespace tokbench;
  auto log = g_root / "calls.log";
  auto script = write_script("llm-cost",
                             "[ \"$1\" = count ] || exit 9\n"
                             "[ \"$3\" = --model ] || exit 9\n"
                             "[ -f \"$2\" ] || exit 8\n"
                             "echo \"$4 $(wc -c < \"$2\" | tr -d ' ')\" >> '" + log.string() + "'\n"
                             "echo \"1234 tokens\"");
  ProcessRunner runner(script, "llm-cost");
  RunConfig cfg;
  cfg.encoding = "cl100k_base";
  cfg.iterations = 4;
  cfg.warmup = 2;

  auto r = runner.Run("hello world", cfg);
  assert(r.has_value());
  assert(r->name == "llm-cost");
  assert(r->tokens == 1234);
  assert(r->times_ns.size() == 4);
  assert(r->iterations == 4);
  assert(r->input_bytes == 11);
  assert(tmp_entries() == 0);

  // Every invocation (2 warmup + 4 timed) saw the full corpus and the model.
  std::istringstream lines(read_all(log));
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    assert(line == "gpt-4 11");
    ++count;
  }
  assert(count == 6);
}

static void test_process_runner_degrades_on_bad_output() {
  using namespace tokbench;
  RunConfig cfg;
  cfg.iterations = 2;
  cfg.warmup = 0;

  auto garbage = write_script("garbage", "echo 'no numbers here'");
  auto r = ProcessRunner(garbage).Run("abc", cfg);
  assert(r.has_value() && r->tokens == 0 && r->times_ns.size() == 2);

  auto silent = write_script("silent", "exit 0");
  r = ProcessRunner(silent).Run("abc", cfg);
  assert(r.has_value() && r->tokens == 0);
  assert(tmp_entries() == 0);
}

static void test_process_runner_cleans_up_on_failure() {
  using namespace tokbench;
  auto marker = g_root / "seen-input";
  auto failing = write_script("failing", "echo \"$2\" > '" + marker.string() + "'\nexit 3");

  for (std::uint64_t warmup : {0u, 2u}) {
    fs::remove(marker);
    RunConfig cfg;
    cfg.iterations = 3;
    cfg.warmup = warmup;

    bool threw = false;
    try {
      (void)ProcessRunner(failing).Run("some corpus text", cfg);
    } catch (const ProcessError& e) {
      threw = true;
      assert(e.exit_status() == 3);
      assert(e.argv().size() == 5);
    }
    assert(threw);

    // The child saw a real file, and it is gone now.
    auto seen = read_all(marker);
    while (!seen.empty() && (seen.back() == '\n' || seen.back() == '\r')) seen.pop_back();
    assert(!seen.empty());
    assert(fs::path(seen).parent_path() == g_tmp);
    assert(!fs::exists(seen));
    assert(tmp_entries() == 0);
  }
}

static void test_run_checked() {
  using namespace tokbench;
  auto out = RunCaptured({"/bin/sh", "-c", "printf 'abc'; exit 4"});
  assert(out.exit_status == 4);
  assert(out.stdout_text == "abc");

  bool threw = false;
  try {
    (void)RunChecked({"/bin/sh", "-c", "exit 1"});
  } catch (const ProcessError& e) {
    threw = e.exit_status() == 1;
  }
  assert(threw);

  // exec failure in the child surfaces as status 127.
  out = RunCaptured({(g_root / "bin" / "nope").string()});
  assert(out.exit_status == 127);
  assert(out.stderr_text.find("execv") != std::string::npos);

  threw = false;
  try {
    (void)RunChecked({"/bin/sh", "-c", "echo 'unknown model' >&2; exit 2"});
  } catch (const ProcessError& e) {
    threw = true;
    assert(e.exit_status() == 2);
    assert(e.stderr_text() == "unknown model\n");
    assert(std::string(e.what()).find("(unknown model)") != std::string::npos);
  }
  assert(threw);
}

static void test_child_stderr_stays_private() {
  using namespace tokbench;
  auto noisy = write_script("noisy", "echo CANDIDATE-STDERR-NOISE >&2\necho 7");
  RunConfig cfg;
  cfg.iterations = 3;
  cfg.warmup = 2;

  std::optional<BenchmarkResult> r;
  auto seen = capture_stderr([&] { r = ProcessRunner(noisy).Run("abc", cfg); });
  assert(r.has_value() && r->tokens == 7 && r->times_ns.size() == 3);
  assert(seen.find("CANDIDATE-STDERR-NOISE") == std::string::npos);

  auto out = RunCaptured({noisy});
  assert(out.stdout_text == "7\n");
  assert(out.stderr_text == "CANDIDATE-STDERR-NOISE\n");

  // More stderr than a pipe buffer holds: drained without stalling, kept in part.
  out = RunCaptured({"/bin/sh", "-c", "head -c 200000 /dev/zero >&2; echo done"});
  assert(out.exit_status == 0);
  assert(out.stdout_text == "done\n");
  assert(out.stderr_text.size() == kStderrKeepBytes);
}

static void test_child_stdin_is_empty() {
  using namespace tokbench;
  auto reader = write_script("reader", "if read -r line; then echo 1; else echo 0; fi");
  auto out = RunCaptured({reader});
  assert(out.exit_status == 0);
  assert(out.stdout_text == "0\n");
}

static void test_temp_file() {
  using namespace tokbench;
  std::string path;
  {
    TempFile f("payload");
    path = f.path();
    assert(fs::exists(path));
    assert(read_all(path) == "payload");
    assert(path.size() > 4 && path.compare(path.size() - 4, 4, ".txt") == 0);
  }
  assert(!fs::exists(path));

  TempFile g("x");
  path = g.path();
  g.Remove();
  assert(!fs::exists(path));
  g.Remove();
}

int main() {
  setup();
  test_helpers();
  test_library_runner();
  test_library_runner_propagates();
  test_process_runner_missing_binary();
  test_process_runner_success();
  test_process_runner_degrades_on_bad_output();
  test_process_runner_cleans_up_on_failure();
  test_run_checked();
  test_child_stderr_stays_private();
  test_child_stdin_is_empty();
  test_temp_file();
  fs::remove_all(g_root);
  return 0;
}
