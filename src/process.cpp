#include "tokbench/process.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tokbench {

namespace {

std::string join_argv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out.push_back(' ');
    out += a;
  }
  return out;
}

std::string errno_message(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

void close_quietly(int fd) {
  if (fd >= 0) {
    ::close(fd);
  }
}

bool write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

// Reads both pipes to EOF. stdout is kept whole, stderr up to
// kStderrKeepBytes; the child never blocks on a full pipe.
bool drain_pipes(int out_fd, int err_fd, ProcessOutput& result) {
  pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  int open_count = 2;
  char buf[1 << 12];
  while (open_count > 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    for (int k = 0; k < 2; ++k) {
      if (fds[k].fd < 0 || fds[k].revents == 0) continue;
      ssize_t n = ::read(fds[k].fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) continue;
      if (n < 0) return false;
      if (n == 0) {
        fds[k].fd = -1;
        --open_count;
        continue;
      }
      const auto len = static_cast<std::size_t>(n);
      if (k == 0) {
        result.stdout_text.append(buf, len);
      } else if (result.stderr_text.size() < kStderrKeepBytes) {
        result.stderr_text.append(buf, std::min(len, kStderrKeepBytes - result.stderr_text.size()));
      }
    }
  }
  return true;
}

}  // namespace

ProcessOutput RunCaptured(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    throw ProcessError("empty command line", argv, -1);
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0) {
    throw ProcessError(errno_message("pipe failed"), argv, -1);
  }
  if (::pipe(err_pipe) != 0) {
    const auto msg = errno_message("pipe failed");
    close_quietly(out_pipe[0]);
    close_quietly(out_pipe[1]);
    throw ProcessError(msg, argv, -1);
  }
  int null_in = ::open("/dev/null", O_RDONLY);
  if (null_in < 0) {
    const auto msg = errno_message("open /dev/null failed");
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) close_quietly(fd);
    throw ProcessError(msg, argv, -1);
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& s : argv) {
    cargv.push_back(const_cast<char*>(s.c_str()));
  }
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    const auto msg = errno_message("fork failed");
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], null_in}) close_quietly(fd);
    throw ProcessError(msg, argv, -1);
  }
  if (pid == 0) {
    ::dup2(null_in, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], null_in}) {
      if (fd > STDERR_FILENO) ::close(fd);
    }
    ::execv(cargv[0], cargv.data());
    std::fprintf(stderr, "execv %s failed: %s\n", cargv[0], std::strerror(errno));
    std::_Exit(127);
  }

  ::close(null_in);
  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ProcessOutput result;
  const bool drained = drain_pipes(out_pipe[0], err_pipe[0], result);
  const int drain_errno = errno;
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ProcessError(errno_message("waitpid failed"), argv, -1);
    }
  }
  if (!drained) {
    errno = drain_errno;
    throw ProcessError(errno_message("reading child output failed"), argv, -1);
  }
  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
  } else {
    result.exit_status = -1;
  }
  return result;
}

ProcessOutput RunChecked(const std::vector<std::string>& argv) {
  auto out = RunCaptured(argv);
  if (out.exit_status != 0) {
    std::string what = "command exited with status " + std::to_string(out.exit_status) + ": " + join_argv(argv);
    const auto first_line = out.stderr_text.substr(0, out.stderr_text.find('\n'));
    if (!first_line.empty()) {
      what += " (" + first_line + ")";
    }
    throw ProcessError(what, argv, out.exit_status, std::move(out.stderr_text));
  }
  return out;
}

TempFile::TempFile(std::string_view contents, const std::string& suffix) {
  std::string tmpl = (std::filesystem::temp_directory_path() / "tokbench-XXXXXX").string() + suffix;
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');

  int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw std::runtime_error(errno_message("failed to create temp file " + tmpl));
  }
  path_.assign(name.data());

  const bool written = write_all(fd, contents);
  const int write_errno = errno;
  const bool closed = ::close(fd) == 0;
  if (!written || !closed) {
    if (!written) errno = write_errno;
    const auto msg = errno_message("failed to write temp file " + path_);
    ::unlink(path_.c_str());
    throw std::runtime_error(msg);
  }
}

TempFile::~TempFile() {
  if (removed_) {
    return;
  }
  if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
    std::cerr << "warning: failed to remove temp file " << path_ << ": " << std::strerror(errno) << "\n";
  }
}

void TempFile::Remove() {
  if (removed_) {
    return;
  }
  removed_ = true;
  if (::unlink(path_.c_str()) != 0) {
    throw std::runtime_error(errno_message("failed to remove temp file " + path_));
  }
}

}  // namespace tokbench
