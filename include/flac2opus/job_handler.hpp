/**
 * @file job_handler.hpp
 * @brief Per-file work: freshness, dry-run, encode or copy
 *
 * @details FileJobHandler is the JobHandler used for real runs. For each
 *          job it:
 *
 *          1. Skips if cancellation was requested
 *
 *          2. Skips if the destination is up to date
 *
 *          3. Reports DryRun without touching the destination tree
 *
 *          4. Creates the destination directory and either runs the
 *             encoder or copies the file (preserving its mtime)
 *
 *          5. Emits a JobReport to the run log
 */

#ifndef FLAC2OPUS_JOB_HANDLER_HPP
#define FLAC2OPUS_JOB_HANDLER_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "job_scheduler.hpp"
#include "types.hpp"

namespace flac2opus {

class CancellationToken;
class ProcessRunner;
class RunLog;

/**
 * @brief Build the encoder argument list for one job.
 * @return {"--bitrate", bitrate, source, destination}
 */
std::vector<std::string> encoder_arguments(const Job &job,
                                           const std::string &bitrate);

/**
 * @class FileJobHandler
 * @brief Executes transcode and copy jobs against the filesystem.
 * @note Stateless apart from references; safe to share between workers.
 */
class FileJobHandler : public JobHandler {
public:
  FileJobHandler(const RunSettings &settings, ProcessRunner &runner,
                 const CancellationToken &token, RunLog &log)
      : settings_(settings), runner_(runner), token_(token), log_(log) {}

  Outcome handle(const Job &job, int worker_id) override;

private:
  /// Run the encoder; fills report.outcome and report.detail
  void transcode(const Job &job, JobReport &report);

  /// Copy bytes and mtime; fills report.outcome and report.detail
  void copy(const Job &job, JobReport &report);

  const RunSettings &settings_;
  ProcessRunner &runner_;
  const CancellationToken &token_;
  RunLog &log_;
};

} // namespace flac2opus

#endif // FLAC2OPUS_JOB_HANDLER_HPP
