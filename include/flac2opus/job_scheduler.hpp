/**
 * @file job_scheduler.hpp
 * @brief Parallel job execution over a fixed worker pool
 *
 * @details The JobScheduler class fans a list of jobs out to workers:
 *
 *          - W = 1 runs every job on the calling thread, in order
 *
 *          - W > 1 spawns W worker threads pulling from a shared queue
 *
 *          - Every job yields exactly one Outcome in the ResultTally,
 *            including jobs skipped because of cancellation
 *
 *          - Logging is worker-prefixed for clarity
 */

#ifndef FLAC2OPUS_JOB_SCHEDULER_HPP
#define FLAC2OPUS_JOB_SCHEDULER_HPP

#include <atomic>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "types.hpp"

namespace flac2opus {

class CancellationToken;
class RunLog;

/**
 * @class JobHandler
 * @brief The unit of work a worker performs for one job.
 * @note Implementations must be callable from several workers at once and
 *       should report failures as Outcome::Failed rather than throwing.
 */
class JobHandler {
public:
  virtual ~JobHandler() = default;

  /**
   * @param job The job to execute
   * @param worker_id 0-indexed worker executing it (for log prefixes)
   */
  virtual Outcome handle(const Job &job, int worker_id) = 0;
};

/**
 * @class JobScheduler
 * @brief Distributes jobs to workers and tallies their outcomes.
 *
 * @attention CANCELLATION:
 *
 *   - Workers check the token before claiming each job
 *
 *   - Once it is set, every remaining job is tallied Skipped without
 *     reaching the handler
 *
 *   - A job already in flight runs to the end of its current unit of work
 */
class JobScheduler {
public:
  /**
   * @param num_workers Worker count (values below 1 are treated as 1)
   * @param handler Executes each job
   * @param token Run-wide cancellation flag
   * @param log Run logger
   */
  JobScheduler(int num_workers, JobHandler &handler,
               const CancellationToken &token, RunLog &log);

  /**
   * @brief Execute all jobs.
   *
   * @param jobs Jobs to run; each is handed to exactly one worker
   * @param label Phase name for log lines, e.g. "Transcoding"
   * @return Tally whose total equals jobs.size()
   */
  TallySnapshot run(const std::vector<Job> &jobs, const std::string &label);

  int num_workers() const { return num_workers_; }

private:
  int num_workers_;
  JobHandler &handler_;
  const CancellationToken &token_;
  RunLog &log_;

  std::mutex queue_mutex_;          //< Protects work_queue_
  std::queue<const Job *> work_queue_; //< Jobs not yet claimed
  std::atomic<size_t> jobs_done_{0};   //< Counter for progress
  size_t total_jobs_{0};               //< Jobs in the current run
  std::string label_;                  //< Current phase name
  ResultTally tally_;                  //< Outcome counters

  /**
   * @brief Claim the next unclaimed job.
   * @param job Output: the claimed job
   * @return true if a job was claimed, false if the queue is empty
   */
  bool get_next_job(const Job *&job);

  /**
   * @brief Worker loop: claim, execute (or skip), tally, repeat.
   * @param worker_id The worker's ID (0-indexed)
   */
  void worker(int worker_id);

  /// Run the handler with exception containment
  Outcome execute(const Job &job, int worker_id);
};

} // namespace flac2opus

#endif // FLAC2OPUS_JOB_SCHEDULER_HPP
