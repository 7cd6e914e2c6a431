#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tokbench {

// Raised when a child process cannot be started or exits unsuccessfully.
class ProcessError : public std::runtime_error {
 public:
  ProcessError(const std::string& what, std::vector<std::string> argv, int exit_status,
               std::string stderr_text = {})
      : std::runtime_error(what),
        argv_(std::move(argv)),
        exit_status_(exit_status),
        stderr_text_(std::move(stderr_text)) {}

  [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }
  // Exit code, or 128 + signal number when the child was killed.
  [[nodiscard]] int exit_status() const noexcept { return exit_status_; }
  // Leading part of the child's stderr, possibly empty.
  [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }

 private:
  std::vector<std::string> argv_;
  int exit_status_;
  std::string stderr_text_;
};

// Only this much of a child's stderr is kept; the rest is read and dropped.
inline constexpr std::size_t kStderrKeepBytes = 4096;

struct ProcessOutput {
  int exit_status = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// fork/execv `argv` (argv[0] is the executable path), wait for it and return
// its captured output. The child reads stdin from /dev/null and never writes
// to our stdout or stderr. Blocks until the child exits; no timeout.
ProcessOutput RunCaptured(const std::vector<std::string>& argv);

// Same, but throws ProcessError on a non-zero exit status.
ProcessOutput RunChecked(const std::vector<std::string>& argv);

// Scoped temporary file created with mkstemp. The file is unlinked by Remove()
// or, at the latest, by the destructor.
class TempFile {
 public:
  // Throws std::runtime_error when the file cannot be created or written.
  explicit TempFile(std::string_view contents, const std::string& suffix = ".txt");
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

  // Deletes the file now; throws std::runtime_error if unlink fails.
  void Remove();

 private:
  std::string path_;
  bool removed_ = false;
};

}  // namespace tokbench
