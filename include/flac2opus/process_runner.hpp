/**
 * @file process_runner.hpp
 * @brief External encoder execution with cancellable waits
 *
 * @details Provides:
 *
 *          - ProcessHandle: one started child process, signalable from
 *            other threads until its exit has been observed
 *
 *          - ActiveProcessSet: registry of live handles shared between
 *            workers and the cancellation coordinator
 *
 *          - ProcessRunner: posix_spawn + wait, returning a typed result
 *
 * @attention LOCKING:
 *
 *   - ActiveProcessSet's mutex is held only to insert, remove or
 *     snapshot handles, never while spawning or waiting
 *
 *   - A handle's own mutex orders "exit observed" against signals, so a
 *     reaped (and possibly recycled) pid is never signalled
 */

#ifndef FLAC2OPUS_PROCESS_RUNNER_HPP
#define FLAC2OPUS_PROCESS_RUNNER_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace flac2opus {

class CancellationToken;
class RunLog;

/**
 * @class ProcessHandle
 * @brief A started child process.
 * @note Shared between the worker that waits on it and the coordinator
 *       that may signal it; the worker is the only one that reaps.
 */
class ProcessHandle {
public:
  explicit ProcessHandle(pid_t pid) : pid_(pid) {}

  pid_t pid() const { return pid_; }

  /**
   * @brief Send SIGTERM unless the exit has already been observed.
   * @return true if the signal was sent
   */
  bool terminate();

  /**
   * @brief Send SIGKILL unless the exit has already been observed.
   * @return true if the signal was sent
   */
  bool kill();

  /**
   * @brief Block until the exit is observed or the deadline passes.
   * @return true if the process has exited
   */
  bool wait_for_exit(std::chrono::steady_clock::time_point deadline);

  /// Called by the waiting worker once the child is known to be dead
  void mark_exited();

  bool exited() const;

  /// Whether terminate() or kill() actually delivered a signal
  bool stop_requested() const;

private:
  bool send(int sig);

  const pid_t pid_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool exited_{false};
  bool stop_requested_{false};
};

/**
 * @class ActiveProcessSet
 * @brief Handles of processes started and not yet confirmed dead.
 *
 * @attention Once close() has been called the set refuses new entries;
 *            a runner whose add() is refused kills its own child.
 */
class ActiveProcessSet {
public:
  /**
   * @brief Register a freshly started process.
   * @note The handle is always inserted.
   * @return false if the set was already closed by a cancellation
   */
  bool add(const std::shared_ptr<ProcessHandle> &handle);

  /// Deregister after the exit has been observed
  void remove(pid_t pid);

  /**
   * @brief Stop accepting processes and return the current ones.
   * @return Snapshot of every registered handle
   */
  std::vector<std::shared_ptr<ProcessHandle>> close();

  size_t size() const;
  bool closed() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<pid_t, std::shared_ptr<ProcessHandle>> handles_;
  bool closed_{false};
};

/**
 * @enum ProcessStatus
 * @brief How a run() ended.
 */
enum class ProcessStatus {
  Exited,      //< Ran to completion; see exit_code
  StartFailed, //< Could not be started (missing binary, permissions)
  Interrupted  //< Stopped (or never started) because of cancellation
};

/**
 * @struct ProcessResult
 * @brief Outcome of one external process invocation.
 */
struct ProcessResult {
  ProcessStatus status = ProcessStatus::Exited;
  bool started = false;    //< A child process was actually spawned
  int exit_code = -1;      //< Exit status when status == Exited, else -1
  int term_signal = 0;     //< Signal that killed the child, if any
  std::string error;       //< Human-readable reason when not successful
  std::string diagnostics; //< Captured stderr (failures only)

  bool ok() const { return status == ProcessStatus::Exited && exit_code == 0; }
};

/**
 * @class ProcessRunner
 * @brief Runs an executable to completion unless cancelled.
 *
 * @attention SEQUENCE:
 *
 * 1. Check the cancellation token (Interrupted if already set)
 *
 * 2. posix_spawnp with stdin/stdout on /dev/null, stderr captured to an
 *    anonymous temporary file, own process group
 *
 * 3. Register the handle in the ActiveProcessSet
 *
 * 4. Wait for exit (waitid with WNOWAIT), mark handle exited, reap
 *
 * 5. Deregister and classify the result
 */
class ProcessRunner {
public:
  ProcessRunner(ActiveProcessSet &active, const CancellationToken &token,
                RunLog &log)
      : active_(active), token_(token), log_(log) {}

  /**
   * @brief Start executable with args and block until it finishes.
   * @param executable Name (PATH lookup) or path of the program
   * @param args Arguments after argv[0]
   * @return Typed result; never throws for process failures
   */
  ProcessResult run(const std::string &executable,
                    const std::vector<std::string> &args);

private:
  ActiveProcessSet &active_;
  const CancellationToken &token_;
  RunLog &log_;
};

} // namespace flac2opus

#endif // FLAC2OPUS_PROCESS_RUNNER_HPP
