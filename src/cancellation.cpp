/**
 * @file cancellation.cpp
 * @brief Cancellation coordinator and interrupt watcher implementation
 */

#include "flac2opus/cancellation.hpp"

#include <cerrno>
#include <system_error>

#include "flac2opus/logging.hpp"
#include "flac2opus/process_runner.hpp"

namespace flac2opus {

namespace {

/// Set by the signal handler, consumed by InterruptWatcher::poll_loop
volatile std::sig_atomic_t g_interrupt_requested = 0;

/// Async-signal-safe: only set the flag
void on_interrupt_signal(int) { g_interrupt_requested = 1; }

constexpr auto WATCH_POLL_INTERVAL = std::chrono::milliseconds(50);

} // anonymous namespace

// **---- CancellationCoordinator ----**

bool CancellationCoordinator::cancel() {
  if (!token_.request())
    return false;

  log_.error("Interrupted by user (Ctrl-C). Terminating subprocesses...");

  auto handles = active_.close();

  /// Ask everything to stop first, then wait against one deadline
  for (const auto &handle : handles) {
    if (handle->terminate()) {
      log_.info("Terminated subprocess with PID {}.", handle->pid());
    }
  }

  auto deadline = std::chrono::steady_clock::now() + grace_;
  for (const auto &handle : handles) {
    if (handle->wait_for_exit(deadline)) {
      log_.info("Subprocess with PID {} has exited.", handle->pid());
      continue;
    }
    log_.warn("Subprocess with PID {} did not terminate in time. Killing it.",
              handle->pid());
    handle->kill();
  }

  /// SIGKILL cannot be ignored; the owning worker observes the exit shortly
  for (const auto &handle : handles) {
    while (!handle->wait_for_exit(std::chrono::steady_clock::now() +
                                  std::chrono::seconds(1))) {
      log_.warn("Still waiting for killed subprocess with PID {}.",
                handle->pid());
    }
  }

  log_.error("All subprocesses terminated.");
  return true;
}

// **---- InterruptWatcher ----**

InterruptWatcher::~InterruptWatcher() { stop(); }

void InterruptWatcher::start() {
  if (running_)
    return;

  g_interrupt_requested = 0;
  stop_.store(false);

  prev_int_ = std::signal(SIGINT, on_interrupt_signal);
  if (prev_int_ == SIG_ERR) {
    throw std::system_error(errno, std::generic_category(),
                            "cannot install SIGINT handler");
  }
  prev_term_ = std::signal(SIGTERM, on_interrupt_signal);
  if (prev_term_ == SIG_ERR) {
    std::signal(SIGINT, prev_int_);
    throw std::system_error(errno, std::generic_category(),
                            "cannot install SIGTERM handler");
  }

  running_ = true;
  watcher_ = std::thread(&InterruptWatcher::poll_loop, this);
}

void InterruptWatcher::stop() {
  if (!running_)
    return;

  stop_.store(true);
  if (watcher_.joinable()) {
    watcher_.join();
  }

  std::signal(SIGINT, prev_int_);
  std::signal(SIGTERM, prev_term_);
  running_ = false;
}

void InterruptWatcher::poll_loop() {
  while (!stop_.load()) {
    if (g_interrupt_requested) {
      g_interrupt_requested = 0;
      coordinator_.cancel();
    }
    std::this_thread::sleep_for(WATCH_POLL_INTERVAL);
  }

  /// A signal that arrived right before stop() still counts
  if (g_interrupt_requested) {
    g_interrupt_requested = 0;
    coordinator_.cancel();
  }
}

} // namespace flac2opus
