/**
 * @file logging.cpp
 * @brief RunLog implementation
 *
 * @details Console lines keep the `[LEVEL] message` shape with colour per
 *          level; file lines are prefixed with a local timestamp.
 */

#include "flac2opus/logging.hpp"

#include <cerrno>
#include <ctime>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>

namespace flac2opus {

namespace fs = std::filesystem;

// **----- Internal Helpers -----**

namespace {

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::FILE *open_append(const fs::path &path) {
  /// "e" sets O_CLOEXEC so encoders never inherit the run logs
  std::FILE *f = std::fopen(path.c_str(), "ae");
  if (!f) {
    throw std::system_error(errno, std::generic_category(),
                            "cannot open log file " + path.string());
  }
  return f;
}

std::string format_bytes(const std::optional<uintmax_t> &bytes) {
  return bytes ? fmt::format("{}", *bytes) : std::string("N/A");
}

} // anonymous namespace

// **----- RunLog -----**

RunLog::RunLog(bool verbose) : verbose_(verbose) {}

RunLog::RunLog(const fs::path &log_dir, bool verbose, const std::string &stem)
    : verbose_(verbose) {
  std::time_t now = std::time(nullptr);
  log_file_ = log_dir / fmt::format("{}_{}.log", stem, now);
  error_log_file_ = log_dir / fmt::format("{}_{}.errors.log", stem, now);

  log_ = open_append(log_file_);
  try {
    error_log_ = open_append(error_log_file_);
  } catch (...) {
    std::fclose(log_);
    log_ = nullptr;
    throw;
  }
}

RunLog::~RunLog() { close(); }

void RunLog::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_) {
    std::fclose(log_);
    log_ = nullptr;
  }
  if (error_log_) {
    std::fclose(error_log_);
    error_log_ = nullptr;
  }
}

void RunLog::write(LogLevel level, LogStyle style, const std::string &msg) {
  std::lock_guard<std::mutex> lock(mutex_);

  /// Console
  if (level != LogLevel::Info || verbose_ || style == LogStyle::Progress) {
    switch (level) {
    case LogLevel::Error:
      fmt::print(stderr, fg(fmt::color::red), "[ERROR] {}\n", msg);
      std::fflush(stderr);
      break;
    case LogLevel::Warn:
      fmt::print(stderr, fg(fmt::color::yellow), "[WARN] {}\n", msg);
      std::fflush(stderr);
      break;
    case LogLevel::Info:
      if (style == LogStyle::Phase) {
        fmt::print(fg(fmt::color::cyan), "{}\n", msg);
      } else if (style == LogStyle::Success) {
        fmt::print(fg(fmt::color::green), "{}\n", msg);
      } else if (style == LogStyle::Progress) {
        fmt::print("{}\n", msg);
      } else {
        fmt::print("[INFO] {}\n", msg);
      }
      std::fflush(stdout);
      break;
    }
  }

  if (!log_ && !error_log_)
    return;

  std::string line =
      fmt::format("{:%Y-%m-%d %H:%M:%S} [{}] {}\n",
                  fmt::localtime(std::time(nullptr)), level_tag(level), msg);

  if (log_) {
    std::fputs(line.c_str(), log_);
    std::fflush(log_);
  }
  if (error_log_ && level == LogLevel::Error) {
    std::fputs(line.c_str(), error_log_);
    std::fflush(error_log_);
  }
}

void RunLog::record_job(const JobReport &report) {
  const Job &job = report.job;
  const bool transcode = job.kind == JobKind::Transcode;

  switch (report.outcome) {
  case Outcome::Success:
    if (transcode) {
      success("Successfully transcoded '{}' to '{}'.",
              job.source_path.string(), job.destination_path.string());
      info("File Size: Source={} bytes, Destination={} bytes.",
           format_bytes(report.source_bytes), format_bytes(report.dest_bytes));
      info("Conversion Duration: {:.2f} seconds.", report.duration_sec);
    } else {
      info("Copied '{}' to '{}'.", job.source_path.string(),
           job.destination_path.string());
    }
    break;
  case Outcome::Skipped:
    info("Skipping '{}': {}.", job.source_path.string(),
         report.detail.empty() ? "skipped" : report.detail);
    break;
  case Outcome::DryRun:
    if (transcode) {
      info("Dry-run: Would transcode '{}' to '{}'.", job.source_path.string(),
           job.destination_path.string());
    } else {
      info("Dry-run: Would copy '{}' to '{}'.", job.source_path.string(),
           job.destination_path.string());
    }
    break;
  case Outcome::Failed:
    error("Failed to {} '{}' to '{}': {}", transcode ? "transcode" : "copy",
          job.source_path.string(), job.destination_path.string(),
          report.detail.empty() ? "unknown error" : report.detail);
    break;
  }
}

} // namespace flac2opus
