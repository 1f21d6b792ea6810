/**
 * @file cancellation.hpp
 * @brief Run-wide cancellation: token, coordinator and signal watcher
 *
 * @details Provides:
 *
 *          - CancellationToken: monotonic false -> true flag
 *
 *          - CancellationCoordinator: sets the token once and tears down
 *            every live encoder (SIGTERM, grace period, SIGKILL)
 *
 *          - InterruptWatcher: turns SIGINT/SIGTERM into a coordinator
 *            call from an ordinary thread
 */

#ifndef FLAC2OPUS_CANCELLATION_HPP
#define FLAC2OPUS_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

namespace flac2opus {

class ActiveProcessSet;
class RunLog;

/**
 * @class CancellationToken
 * @brief Process-wide stop flag; set at most once.
 */
class CancellationToken {
public:
  /**
   * @brief Request cancellation.
   * @return true only for the call that performed the transition
   */
  bool request() { return !cancelled_.exchange(true); }

  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

/**
 * @class CancellationCoordinator
 * @brief Stops the run and every external process it owns.
 *
 * @attention SEQUENCE:
 *
 * 1. Flip the token (repeat calls return immediately)
 *
 * 2. Close the ActiveProcessSet and take its snapshot
 *
 * 3. SIGTERM every snapshotted process
 *
 * 4. Wait for all of them against one shared grace deadline
 *
 * 5. SIGKILL whatever is still alive and wait for it to die
 *
 * @note Safe to call concurrently with workers registering handles; the
 *       set's own lock is the only synchronization involved.
 */
class CancellationCoordinator {
public:
  CancellationCoordinator(CancellationToken &token, ActiveProcessSet &active,
                          RunLog &log, std::chrono::milliseconds grace)
      : token_(token), active_(active), log_(log), grace_(grace) {}

  /**
   * @brief Cancel the run.
   * @return false if cancellation had already been requested
   */
  bool cancel();

private:
  CancellationToken &token_;
  ActiveProcessSet &active_;
  RunLog &log_;
  std::chrono::milliseconds grace_;
};

/**
 * @class InterruptWatcher
 * @brief Routes SIGINT and SIGTERM to a CancellationCoordinator.
 *
 * @note The signal handler only sets a sig_atomic_t flag. A watcher
 *       thread polls it and calls cancel() outside signal context.
 *       Previous handlers are restored by stop() or the destructor.
 *       Only one watcher may be active at a time.
 */
class InterruptWatcher {
public:
  explicit InterruptWatcher(CancellationCoordinator &coordinator)
      : coordinator_(coordinator) {}
  ~InterruptWatcher();

  InterruptWatcher(const InterruptWatcher &) = delete;
  InterruptWatcher &operator=(const InterruptWatcher &) = delete;

  /// Install handlers and start polling
  void start();

  /// Stop polling, join the thread and restore previous handlers
  void stop();

private:
  void poll_loop();

  CancellationCoordinator &coordinator_;
  std::thread watcher_;
  std::atomic<bool> stop_{false};
  bool running_{false};
  void (*prev_int_)(int) = SIG_DFL;
  void (*prev_term_)(int) = SIG_DFL;
};

} // namespace flac2opus

#endif // FLAC2OPUS_CANCELLATION_HPP
