/**
 * @file process_runner.cpp
 * @brief External process execution implementation
 *
 * @details The wait is split in two so that the exit is published on the
 *          handle before the pid is released to the kernel:
 *
 *          1. waitid(WEXITED | WNOWAIT) blocks until the child is a zombie
 *
 *          2. mark_exited() under the handle mutex
 *
 *          3. waitpid() reaps it
 *
 *          A concurrent terminate()/kill() either lands before step 2 (on a
 *          live process or a zombie, both harmless) or sees exited_ and
 *          does nothing.
 */

#include "flac2opus/process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "flac2opus/cancellation.hpp"
#include "flac2opus/logging.hpp"

extern char **environ;

namespace flac2opus {

// **---- Internal Helpers ----**

namespace {

/// Keep at most this much of the child's stderr for the error log
constexpr long MAX_DIAGNOSTIC_BYTES = 4096;

using FilePtr = std::unique_ptr<std::FILE, int (*)(std::FILE *)>;

/// Return the tail of the captured stderr, trimmed of trailing newlines
std::string read_capture(std::FILE *f) {
  if (!f)
    return {};
  if (std::fseek(f, 0, SEEK_END) != 0)
    return {};
  long size = std::ftell(f);
  if (size <= 0)
    return {};

  long start = size > MAX_DIAGNOSTIC_BYTES ? size - MAX_DIAGNOSTIC_BYTES : 0;
  if (std::fseek(f, start, SEEK_SET) != 0)
    return {};

  std::string text(static_cast<size_t>(size - start), '\0');
  size_t n = std::fread(&text[0], 1, text.size(), f);
  text.resize(n);
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

/**
 * @brief RAII wrapper for the posix_spawn setup objects.
 * @note rc holds the first failing return code (0 if all succeeded).
 */
struct SpawnSetup {
  posix_spawn_file_actions_t actions;
  posix_spawnattr_t attr;
  int rc = 0;
  bool actions_ready = false;
  bool attr_ready = false;

  explicit SpawnSetup(int stderr_fd) {
    rc = posix_spawn_file_actions_init(&actions);
    actions_ready = (rc == 0);
    if (rc == 0) {
      rc = posix_spawnattr_init(&attr);
      attr_ready = (rc == 0);
    }

    /// Output streams are discarded; stderr is kept only for diagnostics
    if (rc == 0)
      rc = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO,
                                            "/dev/null", O_RDONLY, 0);
    if (rc == 0)
      rc = posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO,
                                            "/dev/null", O_WRONLY, 0);
    if (rc == 0) {
      rc = stderr_fd >= 0
               ? posix_spawn_file_actions_adddup2(&actions, stderr_fd,
                                                  STDERR_FILENO)
               : posix_spawn_file_actions_addopen(&actions, STDERR_FILENO,
                                                  "/dev/null", O_WRONLY, 0);
    }

    /// Own process group: a terminal Ctrl-C reaches only this program,
    /// and the coordinator decides how children are stopped
    sigset_t no_signals;
    sigset_t default_signals;
    sigemptyset(&no_signals);
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    sigaddset(&default_signals, SIGPIPE);

    if (rc == 0)
      rc = posix_spawnattr_setsigmask(&attr, &no_signals);
    if (rc == 0)
      rc = posix_spawnattr_setsigdefault(&attr, &default_signals);
    if (rc == 0)
      rc = posix_spawnattr_setpgroup(&attr, 0);
    if (rc == 0)
      rc = posix_spawnattr_setflags(
          &attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                     POSIX_SPAWN_SETSIGDEF);
  }

  ~SpawnSetup() {
    if (attr_ready)
      posix_spawnattr_destroy(&attr);
    if (actions_ready)
      posix_spawn_file_actions_destroy(&actions);
  }

  SpawnSetup(const SpawnSetup &) = delete;
  SpawnSetup &operator=(const SpawnSetup &) = delete;
};

} // anonymous namespace

// **---- ProcessHandle ----**

bool ProcessHandle::send(int sig) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (exited_)
    return false;
  if (::kill(pid_, sig) != 0)
    return false;
  stop_requested_ = true;
  return true;
}

bool ProcessHandle::terminate() { return send(SIGTERM); }

bool ProcessHandle::kill() { return send(SIGKILL); }

bool ProcessHandle::wait_for_exit(
    std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_until(lock, deadline, [this] { return exited_; });
}

void ProcessHandle::mark_exited() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exited_ = true;
  }
  cv_.notify_all();
}

bool ProcessHandle::exited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exited_;
}

bool ProcessHandle::stop_requested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stop_requested_;
}

// **---- ActiveProcessSet ----**

bool ActiveProcessSet::add(const std::shared_ptr<ProcessHandle> &handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_[handle->pid()] = handle;
  return !closed_;
}

void ActiveProcessSet::remove(pid_t pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  handles_.erase(pid);
}

std::vector<std::shared_ptr<ProcessHandle>> ActiveProcessSet::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  std::vector<std::shared_ptr<ProcessHandle>> snapshot;
  snapshot.reserve(handles_.size());
  for (const auto &entry : handles_) {
    snapshot.push_back(entry.second);
  }
  return snapshot;
}

size_t ActiveProcessSet::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handles_.size();
}

bool ActiveProcessSet::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

// **---- ProcessRunner ----**

ProcessResult ProcessRunner::run(const std::string &executable,
                                 const std::vector<std::string> &args) {
  ProcessResult result;

  if (token_.cancelled()) {
    result.status = ProcessStatus::Interrupted;
    result.error = "cancelled before start";
    return result;
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(executable.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  /// Anonymous temporary file for the child's stderr (deleted on close)
  FilePtr capture(std::tmpfile(), &std::fclose);
  if (!capture) {
    log_.warn("Cannot capture stderr of '{}': {}", executable,
              std::strerror(errno));
  } else if (::fcntl(fileno(capture.get()), F_SETFD, FD_CLOEXEC) == -1) {
    /// Sibling encoders would hold this capture open
    log_.warn("Cannot mark stderr capture close-on-exec: {}",
              std::strerror(errno));
  }

  pid_t pid = -1;
  {
    SpawnSetup setup(capture ? fileno(capture.get()) : -1);
    int rc = setup.rc;
    if (rc == 0) {
      rc = posix_spawnp(&pid, executable.c_str(), &setup.actions, &setup.attr,
                        argv.data(), environ);
    }
    if (rc != 0) {
      result.status = ProcessStatus::StartFailed;
      result.error = fmt::format("failed to start '{}': {}", executable,
                                 std::strerror(rc));
      return result;
    }
  }

  result.started = true;
  auto handle = std::make_shared<ProcessHandle>(pid);
  if (!active_.add(handle)) {
    /// Cancellation closed the set between the token check and the spawn
    log_.warn("Run is being cancelled; killing just-started PID {}", pid);
    handle->kill();
  }

  siginfo_t info;
  int waited;
  do {
    std::memset(&info, 0, sizeof(info));
    waited = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
  } while (waited == -1 && errno == EINTR);
  int wait_errno = (waited == -1) ? errno : 0;

  handle->mark_exited();

  int status = 0;
  pid_t reaped;
  do {
    reaped = waitpid(pid, &status, 0);
  } while (reaped == -1 && errno == EINTR);
  if (reaped == -1 && wait_errno == 0) {
    wait_errno = errno;
  }

  active_.remove(pid);

  if (wait_errno != 0) {
    result.status = ProcessStatus::Exited;
    result.error = fmt::format("waiting for '{}' (PID {}) failed: {}",
                               executable, pid, std::strerror(wait_errno));
    return result;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }

  if (result.ok())
    return result;

  if (handle->stop_requested()) {
    result.status = ProcessStatus::Interrupted;
    result.error = fmt::format("'{}' (PID {}) was stopped by cancellation",
                               executable, pid);
  } else if (WIFEXITED(status)) {
    result.error = fmt::format("{} exited with code {}", executable,
                               result.exit_code);
  } else {
    result.error = fmt::format("{} was killed by signal {} ({})", executable,
                               result.term_signal,
                               strsignal(result.term_signal));
  }
  result.diagnostics = read_capture(capture.get());
  return result;
}

} // namespace flac2opus
