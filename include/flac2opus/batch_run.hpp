/**
 * @file batch_run.hpp
 * @brief One complete transcode run over a source tree
 *
 * @details The BatchRun class orchestrates the whole workflow:
 *
 *          1. Pre-flight: bitrate syntax, encoder on PATH, source
 *             directory (ConfigError on failure, nothing touched yet)
 *
 *          2. Create the destination root and open the run logs
 *
 *          3. Classify the source tree and plan jobs
 *
 *          4. Transcode phase on the worker pool
 *
 *          5. Pass-through copy phase on the worker pool
 *
 *          6. Return the RunSummary for the reporter
 *
 * @note SIGINT/SIGTERM during steps 4-5 cancel the run; cancel() does the
 *       same from code.
 */

#ifndef FLAC2OPUS_BATCH_RUN_HPP
#define FLAC2OPUS_BATCH_RUN_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "cancellation.hpp"
#include "config.hpp"
#include "file_classifier.hpp"
#include "logging.hpp"
#include "process_runner.hpp"
#include "reporter.hpp"
#include "types.hpp"

namespace flac2opus {

/**
 * @struct JobPlan
 * @brief Jobs for both phases plus files whose path could not be mapped.
 */
struct JobPlan {
  std::vector<Job> transcode;
  std::vector<Job> copy;
  size_t transcode_path_errors = 0; //< Tallied Failed in the transcode phase
  size_t copy_path_errors = 0;      //< Tallied Failed in the copy phase
};

/**
 * @brief Map classified files to jobs.
 * @note A PathError is logged and counted; it never aborts planning.
 */
JobPlan plan_jobs(const Classification &files, const RunSettings &settings,
                  RunLog &log);

/**
 * @brief Validate settings before anything touches the filesystem.
 * @throws ConfigError on malformed bitrate, missing encoder, or a source
 *         path that is not a directory
 */
void preflight(const RunSettings &settings);

/**
 * @class BatchRun
 * @brief Owns the shared run state: token, process set, log, coordinator.
 */
class BatchRun {
public:
  explicit BatchRun(RunSettings settings);
  ~BatchRun();

  BatchRun(const BatchRun &) = delete;
  BatchRun &operator=(const BatchRun &) = delete;

  /**
   * @brief Execute the run. Call once.
   * @return Summary covering every discovered file
   * @throws ConfigError before any job is scheduled
   */
  RunSummary run();

  /// Cancel from any thread; idempotent
  void cancel();

  const ActiveProcessSet &active_processes() const { return active_; }
  bool cancelled() const { return token_.cancelled(); }

private:
  void log_header(int workers);

  RunSettings settings_;
  CancellationToken token_;
  ActiveProcessSet active_;
  std::unique_ptr<RunLog> log_;

  std::mutex coordinator_mutex_; //< Guards coordinator_ creation vs cancel()
  std::unique_ptr<CancellationCoordinator> coordinator_;
};

} // namespace flac2opus

#endif // FLAC2OPUS_BATCH_RUN_HPP
