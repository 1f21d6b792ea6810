/**
 * @file batch_run.cpp
 * @brief Batch run orchestration implementation
 */

#include "flac2opus/batch_run.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "flac2opus/errors.hpp"
#include "flac2opus/job_handler.hpp"
#include "flac2opus/job_scheduler.hpp"
#include "flac2opus/path_mapper.hpp"
#include "flac2opus/system.hpp"

namespace flac2opus {

namespace fs = std::filesystem;

namespace {

std::string now_string() {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

} // anonymous namespace

// **---- Planning ----**

JobPlan plan_jobs(const Classification &files, const RunSettings &settings,
                  RunLog &log) {
  JobPlan plan;
  plan.transcode.reserve(files.transcode.size());
  plan.copy.reserve(files.copy.size());

  auto add_job = [&](const fs::path &source, JobKind kind,
                     std::vector<Job> &out, size_t &errors) {
    try {
      fs::path dest = map_destination(source, settings.source_dir,
                                      settings.dest_dir, kind,
                                      settings.target_ext);
      out.push_back(Job{source, std::move(dest), kind});
    } catch (const PathError &e) {
      log.error("Cannot map '{}': {}", source.string(), e.what());
      ++errors;
    }
  };

  for (const auto &source : files.transcode) {
    add_job(source, JobKind::Transcode, plan.transcode,
            plan.transcode_path_errors);
  }
  for (const auto &source : files.copy) {
    add_job(source, JobKind::Copy, plan.copy, plan.copy_path_errors);
  }
  return plan;
}

// **---- Pre-flight ----**

void preflight(const RunSettings &settings) {
  validate_bitrate(settings.bitrate);

  if (!find_executable(settings.encoder)) {
    throw ConfigError(fmt::format(
        "'{}' not found. Please install it and ensure it's in your PATH.",
        settings.encoder));
  }

  std::error_code ec;
  if (!fs::is_directory(settings.source_dir, ec)) {
    throw ConfigError(fmt::format("Source directory '{}' does not exist.",
                                  settings.source_dir.string()));
  }

  if (settings.target_ext.empty() || settings.target_ext.front() != '.' ||
      settings.source_ext.empty() || settings.source_ext.front() != '.') {
    throw ConfigError(
        fmt::format("Extensions must start with '.', got '{}' and '{}'.",
                    settings.source_ext, settings.target_ext));
  }
}

// **---- BatchRun ----**

BatchRun::BatchRun(RunSettings settings) : settings_(std::move(settings)) {}

BatchRun::~BatchRun() = default;

void BatchRun::cancel() {
  std::lock_guard<std::mutex> lock(coordinator_mutex_);
  if (coordinator_) {
    coordinator_->cancel();
  } else {
    /// No process can be running yet; flipping the flag is enough
    token_.request();
  }
}

void BatchRun::log_header(int workers) {
  log_->info("Transcoding started at {}", now_string());
  log_->info("Source Directory        : {}", settings_.source_dir.string());
  log_->info("Destination Directory   : {}", settings_.dest_dir.string());
  log_->info("Encoder                 : {}", settings_.encoder);
  log_->info("Bitrate                 : {}", settings_.bitrate);
  log_->info("Verbose Mode            : {}", settings_.verbose);
  log_->info("Dry-run Mode            : {}", settings_.dry_run);

  if (settings_.jobs > 0) {
    log_->info("Number of parallel jobs set to: {}", workers);
  } else {
    log_->info("No jobs specified, auto-detected {} jobs.", workers);
  }
  if (workers == 1) {
    log_->info("Single-threaded mode.");
  } else {
    log_->info("Parallel mode with {} jobs.", workers);
  }
}

RunSummary BatchRun::run() {
  /// Nothing below may touch the filesystem before this passes
  preflight(settings_);

  settings_.source_dir = fs::absolute(settings_.source_dir).lexically_normal();
  settings_.dest_dir = fs::absolute(settings_.dest_dir).lexically_normal();

  std::error_code ec;
  fs::create_directories(settings_.dest_dir, ec);
  if (ec) {
    throw ConfigError(fmt::format("Cannot create destination '{}': {}",
                                  settings_.dest_dir.string(), ec.message()));
  }

  log_ = std::make_unique<RunLog>(settings_.dest_dir, settings_.verbose);

  RunSummary summary;
  summary.workers = resolve_worker_count(settings_.jobs);
  summary.log_file = log_->log_file();
  summary.error_log_file = log_->error_log_file();
  log_header(summary.workers);

  auto run_start = std::chrono::steady_clock::now();

  Classification files;
  try {
    files = classify_files(settings_.source_dir, settings_.source_ext);
  } catch (const fs::filesystem_error &e) {
    log_->error("Cannot scan '{}': {}", settings_.source_dir.string(),
                e.what());
    throw ConfigError(e.what());
  }

  JobPlan plan = plan_jobs(files, settings_, *log_);
  summary.transcode_found = files.transcode.size();
  summary.copy_found = files.copy.size();

  if (files.transcode.empty()) {
    log_->info("No {} files found in '{}'.", settings_.source_ext,
               settings_.source_dir.string());
  } else {
    log_->info("Total {} files found: {}", settings_.source_ext,
               files.transcode.size());
  }

  ProcessRunner runner(active_, token_, *log_);
  FileJobHandler handler(settings_, runner, token_, *log_);
  JobScheduler scheduler(summary.workers, handler, token_, *log_);

  {
    std::lock_guard<std::mutex> lock(coordinator_mutex_);
    coordinator_ = std::make_unique<CancellationCoordinator>(
        token_, active_, *log_, settings_.terminate_grace);
  }

  InterruptWatcher watcher(*coordinator_);
  watcher.start();

  // **---- TRANSCODE PHASE ----**

  log_->phase("================== TRANSCODING ==================");
  summary.transcode = scheduler.run(plan.transcode, "Transcoding");
  summary.transcode.add(Outcome::Failed, plan.transcode_path_errors);

  // **---- PASS-THROUGH PHASE ----**

  if (plan.copy.empty()) {
    log_->info("No other files found to copy.");
  } else {
    log_->phase("================== COPYING ======================");
    log_->info("Found {} other files to copy.", plan.copy.size());
  }
  summary.copy = scheduler.run(plan.copy, "Copying");
  summary.copy.add(Outcome::Failed, plan.copy_path_errors);

  watcher.stop();

  summary.cancelled = token_.cancelled();
  summary.wall_clock_sec = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - run_start)
                               .count();

  if (summary.cancelled) {
    log_->error("Run interrupted at {}. Results are partial.", now_string());
  } else {
    log_->info("Transcoding ended at {}", now_string());
    log_->info("All done!");
  }
  log_->close();

  return summary;
}

} // namespace flac2opus
