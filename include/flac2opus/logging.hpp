/**
 * @file logging.hpp
 * @brief Run-scoped logger owning the console and the two log files
 *
 * @details Provides:
 *          - RunLog: one object per run, passed by reference to every
 *            component that logs. It owns three sinks:
 *
 *            1. Console (coloured, WARN and above plus progress, INFO
 *               with --verbose)
 *
 *            2. Activity log file (INFO and above)
 *
 *            3. Error log file (ERROR only)
 *
 *          - JobReport rendering for per-job structured records
 *
 * @note All output uses fmt::print for type-safe formatting and is
 *       flushed immediately so an interrupted run leaves complete logs.
 */

#ifndef FLAC2OPUS_LOGGING_HPP
#define FLAC2OPUS_LOGGING_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "types.hpp"

namespace flac2opus {

enum class LogLevel { Info, Warn, Error };

/// Console styling for an INFO-level line; Progress is shown without --verbose
enum class LogStyle { Plain, Phase, Success, Progress };

/**
 * @class RunLog
 * @brief Thread-safe logger for one batch run.
 *
 * @attention LIFECYCLE:
 *
 *   - Construct at run start; files are opened in append mode
 *
 *   - Pass by reference to scheduler, handler, runner and coordinator
 *
 *   - close() (or destruction) flushes and closes the files
 */
class RunLog {
public:
  /**
   * @brief Console-only logger (no files).
   * @param verbose Echo INFO lines to the console
   */
  explicit RunLog(bool verbose = false);

  /**
   * @brief Logger writing `<stem>_<timestamp>.log` and
   *        `<stem>_<timestamp>.errors.log` into log_dir.
   * @param log_dir Existing directory for the log files
   * @param verbose Echo INFO lines to the console
   * @param stem File name prefix
   * @throws std::system_error if a log file cannot be opened
   */
  RunLog(const std::filesystem::path &log_dir, bool verbose,
         const std::string &stem = "transcode_flac_to_opus");

  ~RunLog();

  RunLog(const RunLog &) = delete;
  RunLog &operator=(const RunLog &) = delete;

  template <typename... Args>
  void info(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Info, LogStyle::Plain,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void phase(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Info, LogStyle::Phase,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void success(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Info, LogStyle::Success,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  /// Per-job progress; always reaches the console
  template <typename... Args>
  void progress(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Info, LogStyle::Progress,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Warn, LogStyle::Plain,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Error, LogStyle::Plain,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  /**
   * @brief Render one finished job into the sinks.
   * @note Failures go to the error log with their detail; successes log
   *       sizes and duration at INFO.
   */
  void record_job(const JobReport &report);

  /// Flush and close both files; later lines reach the console only
  void close();

  const std::filesystem::path &log_file() const { return log_file_; }
  const std::filesystem::path &error_log_file() const {
    return error_log_file_;
  }

private:
  void write(LogLevel level, LogStyle style, const std::string &msg);

  std::mutex mutex_;
  bool verbose_;
  std::FILE *log_ = nullptr;       //< Activity log (INFO+)
  std::FILE *error_log_ = nullptr; //< Error log (ERROR only)
  std::filesystem::path log_file_;
  std::filesystem::path error_log_file_;
};

} // namespace flac2opus

#endif // FLAC2OPUS_LOGGING_HPP
