/**
 * @file job_handler.cpp
 * @brief Per-file job execution implementation
 */

#include "flac2opus/job_handler.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "flac2opus/cancellation.hpp"
#include "flac2opus/freshness.hpp"
#include "flac2opus/logging.hpp"
#include "flac2opus/process_runner.hpp"

namespace flac2opus {

namespace fs = std::filesystem;

std::vector<std::string> encoder_arguments(const Job &job,
                                           const std::string &bitrate) {
  return {"--bitrate", bitrate, job.source_path.string(),
          job.destination_path.string()};
}

Outcome FileJobHandler::handle(const Job &job, int worker_id) {
  auto start_time = std::chrono::steady_clock::now();

  JobReport report{job, Outcome::Failed};

  std::error_code ec;
  uintmax_t src_size = fs::file_size(job.source_path, ec);
  if (!ec) {
    report.source_bytes = src_size;
  }

  if (token_.cancelled()) {
    report.outcome = Outcome::Skipped;
    report.detail = "run was cancelled";
  } else if (check_freshness(job.source_path, job.destination_path) ==
             Freshness::UpToDate) {
    report.outcome = Outcome::Skipped;
    report.detail =
        fmt::format("'{}' is up-to-date", job.destination_path.string());
  } else if (settings_.dry_run) {
    report.outcome = Outcome::DryRun;
  } else {
    /// Sibling jobs may create the same directory concurrently; that is fine
    fs::create_directories(job.destination_path.parent_path(), ec);
    if (ec) {
      report.outcome = Outcome::Failed;
      report.detail = fmt::format("cannot create '{}': {}",
                                  job.destination_path.parent_path().string(),
                                  ec.message());
    } else if (job.kind == JobKind::Transcode) {
      log_.info("[Worker {}] Transcoding '{}'", worker_id,
                job.source_path.filename().string());
      transcode(job, report);
    } else {
      copy(job, report);
    }
  }

  report.duration_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start_time)
                            .count();

  if (report.outcome == Outcome::Success) {
    uintmax_t dest_size = fs::file_size(job.destination_path, ec);
    if (!ec) {
      report.dest_bytes = dest_size;
    }
  }

  log_.record_job(report);
  return report.outcome;
}

void FileJobHandler::transcode(const Job &job, JobReport &report) {
  ProcessResult result =
      runner_.run(settings_.encoder, encoder_arguments(job, settings_.bitrate));

  if (result.ok()) {
    report.outcome = Outcome::Success;
    return;
  }

  report.detail = result.error;
  if (!result.diagnostics.empty()) {
    report.detail += fmt::format("\n{}", result.diagnostics);
  }

  /// A partial output would look up-to-date on the next run
  bool partial_left = false;
  if (result.started) {
    std::error_code ec;
    fs::remove(job.destination_path, ec);
    if (ec) {
      partial_left = true;
      report.detail += fmt::format(" (partial output could not be removed: {})",
                                   ec.message());
    }
  }

  if (result.status == ProcessStatus::Interrupted && !partial_left) {
    report.outcome = Outcome::Skipped;
  } else {
    report.outcome = Outcome::Failed;
  }
}

void FileJobHandler::copy(const Job &job, JobReport &report) {
  std::error_code ec;
  fs::copy_file(job.source_path, job.destination_path,
                fs::copy_options::overwrite_existing, ec);
  if (ec) {
    report.outcome = Outcome::Failed;
    report.detail = ec.message();
    return;
  }

  /// Preserve the source mtime so the copy reads as up-to-date next run
  auto mtime = fs::last_write_time(job.source_path, ec);
  if (!ec) {
    fs::last_write_time(job.destination_path, mtime, ec);
  }
  if (ec) {
    report.outcome = Outcome::Failed;
    report.detail =
        fmt::format("copied but could not preserve mtime: {}", ec.message());
    return;
  }

  report.outcome = Outcome::Success;
}

} // namespace flac2opus
