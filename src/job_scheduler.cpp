/**
 * @file job_scheduler.cpp
 * @brief Parallel job execution implementation
 *
 * @details Implements the JobScheduler class:
 *
 *          - Work-stealing queue for load balancing
 *
 *          - Sequential fast path for a single worker
 *
 *          - Worker-prefixed logging and progress counting
 */

#include "flac2opus/job_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <thread>

#include "flac2opus/cancellation.hpp"
#include "flac2opus/logging.hpp"

namespace flac2opus {

JobScheduler::JobScheduler(int num_workers, JobHandler &handler,
                           const CancellationToken &token, RunLog &log)
    : num_workers_(std::max(1, num_workers)), handler_(handler), token_(token),
      log_(log) {}

TallySnapshot JobScheduler::run(const std::vector<Job> &jobs,
                                const std::string &label) {
  tally_.reset();
  label_ = label;
  total_jobs_ = jobs.size();
  jobs_done_.store(0);

  if (jobs.empty()) {
    return TallySnapshot{};
  }

  /// Populate work queue
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    work_queue_ = {};
    for (const auto &job : jobs) {
      work_queue_.push(&job);
    }
  }

  /// No point starting more threads than there are jobs
  int actual_workers =
      static_cast<int>(std::min<size_t>(num_workers_, jobs.size()));

  if (actual_workers == 1) {
    log_.info("{}: {} jobs, single-threaded mode.", label_, total_jobs_);
    worker(0);
  } else {
    log_.info("{}: {} jobs, parallel mode with {} workers.", label_,
              total_jobs_, actual_workers);

    std::vector<std::thread> workers;
    workers.reserve(actual_workers);
    for (int i = 0; i < actual_workers; ++i) {
      workers.emplace_back(&JobScheduler::worker, this, i);
    }
    for (auto &w : workers) {
      w.join();
    }
  }

  TallySnapshot snap = tally_.snapshot();
  if (token_.cancelled()) {
    log_.warn("{} interrupted after {} of {} jobs.", label_,
              total_jobs_ - snap[Outcome::Skipped], total_jobs_);
  }
  return snap;
}

bool JobScheduler::get_next_job(const Job *&job) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (work_queue_.empty()) {
    return false;
  }
  job = work_queue_.front();
  work_queue_.pop();
  return true;
}

void JobScheduler::worker(int worker_id) {
  const Job *job = nullptr;
  while (get_next_job(job)) {
    Outcome outcome;
    if (token_.cancelled()) {
      /// Drain: the job is accounted for but never started
      outcome = Outcome::Skipped;
    } else {
      outcome = execute(*job, worker_id);
    }

    tally_.record(outcome);
    size_t done = ++jobs_done_;

    if (outcome != Outcome::Skipped || !token_.cancelled()) {
      log_.progress("[Worker {}] {} progress: {}/{} ({})", worker_id, label_,
                    done, total_jobs_, outcome_name(outcome));
    }
  }
}

Outcome JobScheduler::execute(const Job &job, int worker_id) {
  try {
    return handler_.handle(job, worker_id);
  } catch (const std::exception &e) {
    log_.error("[Worker {}] Unexpected error processing '{}': {}", worker_id,
               job.source_path.string(), e.what());
    return Outcome::Failed;
  }
}

} // namespace flac2opus
