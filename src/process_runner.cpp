/**
 * @file process_runner.cpp
 * @brief Encoder process execution implementation
 *
 * @details Spawning uses fork/execv with a close-on-exec status pipe: if
 *          execv fails, the child writes errno into the pipe before
 *          _exit(127), so the parent can tell "executable not found" from
 *          other start failures. A successful exec closes the pipe and the
 *          parent reads EOF.
 */

#include "ytp_forge/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "ytp_forge/line_channel.hpp"
#include "ytp_forge/logging.hpp"
#include "ytp_forge/system.hpp"

namespace ytp_forge {

// **---- Internal Helpers ----**

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

/**
 * @class UniqueFd
 * @brief RAII owner of a file descriptor.
 */
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }

  void reset(int fd = -1) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

/**
 * @class ChildProcess
 * @brief Owns a spawned pid until it has been reaped.
 * @note Destruction of an unreaped child kills it with SIGKILL and reaps it.
 */
class ChildProcess {
public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {}
  ~ChildProcess() {
    if (!reaped_) {
      kill();
      wait();
    }
  }

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  pid_t pid() const { return pid_; }

  void kill() {
    if (!reaped_)
      ::kill(pid_, SIGKILL);
  }

  /// Wait for termination; returns the raw waitpid status
  int wait() {
    int status = 0;
    while (!reaped_) {
      pid_t r = ::waitpid(pid_, &status, 0);
      if (r == pid_ || (r == -1 && errno != EINTR))
        reaped_ = true;
    }
    return status;
  }

private:
  pid_t pid_;
  bool reaped_ = false;
};

/// Exit code, or -signal for a child killed by a signal
int64_t raw_exit_code(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return -static_cast<int64_t>(WTERMSIG(status));
  return status;
}

RunStatus failure(RunErrorKind kind, std::string message) {
  RunStatus st;
  st.kind = kind;
  st.message = std::move(message);
  return st;
}

bool make_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC) == 0; }

/// Read the pipe until EOF or error, pushing lines into the channel
void read_lines(int fd, LineChannel &channel, std::string &error) {
  LineSplitter splitter;
  std::vector<std::string> lines;
  char buf[READ_CHUNK_SIZE];

  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = std::strerror(errno);
      break;
    }
    if (n == 0)
      break;

    lines.clear();
    splitter.feed(buf, static_cast<size_t>(n), lines);
    for (auto &line : lines) {
      if (!channel.push(std::move(line))) {
        channel.finish();
        return;
      }
    }
  }

  if (error.empty()) {
    lines.clear();
    splitter.flush(lines);
    for (auto &line : lines) {
      if (!channel.push(std::move(line)))
        break;
    }
  }
  channel.finish();
}

} // anonymous namespace

// **---- Status Helpers ----**

const char *error_kind_name(RunErrorKind kind) {
  switch (kind) {
  case RunErrorKind::None:
    return "ok";
  case RunErrorKind::MissingInput:
    return "missing-input";
  case RunErrorKind::ExecutableNotFound:
    return "executable-not-found";
  case RunErrorKind::ProcessStartFailed:
    return "process-start-failed";
  case RunErrorKind::ProcessExitedNonzero:
    return "process-exited-nonzero";
  case RunErrorKind::StreamInterrupted:
    return "stream-interrupted";
  }
  return "unknown";
}

int64_t normalize_exit_code(int64_t raw) {
  constexpr int64_t two_31 = int64_t{1} << 31;
  constexpr int64_t two_32 = int64_t{1} << 32;
  if (raw >= two_31 && raw < two_32)
    return raw - two_32;
  return raw;
}

RunStatus validate_inputs(const CommandLine &cmd) {
  RunStatus st;
  if (!is_regular_file(cmd.primary_input))
    st.missing.push_back({"source", cmd.primary_input});
  for (const auto &p : cmd.extra_inputs) {
    if (!is_regular_file(p))
      st.missing.push_back({"extra", p});
  }

  if (!st.missing.empty()) {
    st.kind = RunErrorKind::MissingInput;
    st.message = "Missing input files:";
    for (const auto &m : st.missing) {
      st.message += fmt::format("\n{} file not found: '{}'", m.role, m.path);
    }
  }
  return st;
}

// **---- LineSplitter ----**

void LineSplitter::feed(const char *data, size_t size,
                        std::vector<std::string> &out) {
  for (size_t i = 0; i < size; ++i) {
    char c = data[i];
    if (c == '\n') {
      /// Second half of "\r\n": the line was already emitted
      if (!last_was_cr_)
        emit(out);
      last_was_cr_ = false;
    } else if (c == '\r') {
      emit(out);
      last_was_cr_ = true;
    } else {
      pending_ += c;
      last_was_cr_ = false;
    }
  }
}

void LineSplitter::flush(std::vector<std::string> &out) {
  if (!pending_.empty())
    emit(out);
}

void LineSplitter::emit(std::vector<std::string> &out) {
  size_t end = pending_.find_last_not_of(" \t");
  out.push_back(end == std::string::npos ? std::string()
                                         : pending_.substr(0, end + 1));
  pending_.clear();
}

// **---- Process Execution ----**

RunStatus run_process(const CommandLine &cmd, const LineSink &sink,
                      size_t channel_capacity) {
  /// Validate before anything is spawned
  RunStatus validation = validate_inputs(cmd);
  if (!validation.ok()) {
    LOG_ERROR("{}", validation.message);
    return validation;
  }

  auto resolved = find_executable(cmd.executable);
  if (!resolved) {
    LOG_ERROR("Executable not found: {}", cmd.executable);
    return failure(RunErrorKind::ExecutableNotFound,
                   fmt::format("Executable not found: {}. Ensure it is "
                               "installed and available on PATH.",
                               cmd.executable));
  }

  /// argv is built before fork: the child may only call async-signal-safe
  /// functions
  std::vector<char *> argv;
  argv.reserve(cmd.args.size() + 2);
  argv.push_back(const_cast<char *>(cmd.executable.c_str()));
  for (const auto &arg : cmd.args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  int out_fds[2];
  int status_fds[2];
  if (!make_pipe(out_fds)) {
    return failure(RunErrorKind::ProcessStartFailed,
                   fmt::format("Failed to start process {}: {}",
                               cmd.executable, std::strerror(errno)));
  }
  UniqueFd out_read(out_fds[0]);
  UniqueFd out_write(out_fds[1]);

  if (!make_pipe(status_fds)) {
    return failure(RunErrorKind::ProcessStartFailed,
                   fmt::format("Failed to start process {}: {}",
                               cmd.executable, std::strerror(errno)));
  }
  UniqueFd status_read(status_fds[0]);
  UniqueFd status_write(status_fds[1]);

  pid_t pid = ::fork();
  if (pid < 0) {
    return failure(RunErrorKind::ProcessStartFailed,
                   fmt::format("Failed to start process {}: {}",
                               cmd.executable, std::strerror(errno)));
  }

  if (pid == 0) {
    /// Child: stdin from /dev/null, stdout and stderr into the pipe
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_fds[1], STDOUT_FILENO);
    ::dup2(out_fds[1], STDERR_FILENO);
    ::execv(resolved->c_str(), argv.data());

    int err = errno;
    ssize_t ignored = ::write(status_fds[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  // **---- Parent ----**

  ChildProcess child(pid);
  out_write.reset();
  status_write.reset();

  /// EOF = exec succeeded; an int = errno of the failed exec
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  status_read.reset();

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    child.wait();
    if (exec_errno == ENOENT) {
      LOG_ERROR("Executable not found: {}", cmd.executable);
      return failure(RunErrorKind::ExecutableNotFound,
                     fmt::format("Executable not found: {}. Ensure it is "
                                 "installed and available on PATH.",
                                 cmd.executable));
    }
    LOG_ERROR("Failed to start {}: {}", cmd.executable,
              std::strerror(exec_errno));
    return failure(RunErrorKind::ProcessStartFailed,
                   fmt::format("Failed to start process {}: {}",
                               cmd.executable, std::strerror(exec_errno)));
  }

  LOG_INFO("Started {} (pid {})", *resolved, pid);

  // **---- Stream Output ----**

  LineChannel channel(channel_capacity);
  std::string reader_error;
  std::thread reader(read_lines, out_read.get(), std::ref(channel),
                     std::ref(reader_error));

  /// Unwinding with the reader still running: stop it before the child and
  /// channel go away
  struct ReaderGuard {
    std::thread &reader;
    LineChannel &channel;
    ChildProcess &child;
    ~ReaderGuard() {
      if (reader.joinable()) {
        channel.close();
        child.kill();
        reader.join();
      }
    }
  } guard{reader, channel, child};

  std::string sink_error;
  std::string line;
  while (channel.pop(line)) {
    try {
      sink(line);
    } catch (const std::exception &e) {
      sink_error = e.what();
      break;
    }
  }

  if (!sink_error.empty()) {
    channel.close();
    child.kill();
    reader.join();
    child.wait();
    LOG_ERROR("Log sink failed, killed {} (pid {})", cmd.executable, pid);
    return failure(RunErrorKind::StreamInterrupted,
                   fmt::format("Forwarding output of {} failed: {}",
                               cmd.executable, sink_error));
  }

  reader.join();

  if (!reader_error.empty()) {
    child.kill();
    child.wait();
    LOG_ERROR("Reading output failed, killed {} (pid {})", cmd.executable,
              pid);
    return failure(RunErrorKind::StreamInterrupted,
                   fmt::format("Reading output of {} failed: {}",
                               cmd.executable, reader_error));
  }

  // **---- Exit Status ----**

  int status = child.wait();
  RunStatus st;
  st.raw_exit_code = raw_exit_code(status);
  st.exit_code = normalize_exit_code(st.raw_exit_code);

  if (st.raw_exit_code != 0) {
    st.kind = RunErrorKind::ProcessExitedNonzero;
    st.message = fmt::format("Process exited with code {} (interpreted as "
                             "{}). See log above for ffmpeg errors.",
                             st.raw_exit_code, st.exit_code);
    LOG_ERROR("{} exited with code {}", cmd.executable, st.exit_code);
  }
  return st;
}

} // namespace ytp_forge
