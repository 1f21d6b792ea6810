/**
 * @file types.hpp
 * @brief Core data types and constants for flac2opus
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Cache alignment constants
 *
 *          - Job and Outcome
 *
 *          - ResultTally for concurrent outcome counting
 *
 *          - JobReport for structured per-job logging
 */

#ifndef FLAC2OPUS_TYPES_HPP
#define FLAC2OPUS_TYPES_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace flac2opus {

// **----- CONSTANTS -----**

/**
 * @brief CPU cache line size for alignment.
 * @note Most modern CPUs use 64-byte cache lines.
 *       Aligning hot data to cache lines prevents false sharing in
 *       multi-threaded code.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

// **----- DATA STRUCTURES -----**

/**
 * @enum JobKind
 * @brief What a worker does with a source file.
 */
enum class JobKind {
  Transcode, //< Run the external encoder
  Copy       //< Byte-identical pass-through copy
};

/**
 * @struct Job
 * @brief Immutable unit of work: one source file, one destination.
 * @note Created once while planning; consumed exactly once by a worker.
 */
struct Job {
  std::filesystem::path source_path;      //< Absolute source file
  std::filesystem::path destination_path; //< Mapped destination file
  JobKind kind;                           //< Transcode or Copy
};

/**
 * @enum Outcome
 * @brief Closed classification of a finished job.
 */
enum class Outcome { Success = 0, Failed, Skipped, DryRun };

constexpr size_t OUTCOME_COUNT = 4;

/// Lower-case label used in logs and summaries
const char *outcome_name(Outcome outcome);

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 * @note When multiple atomics are updated by different threads, they
 *       should each be on separate cache lines to avoid invalidation.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  T load() const { return value.load(std::memory_order_relaxed); }
  void store(T v) { value.store(v, std::memory_order_relaxed); }
  T operator++() { return value.fetch_add(1, std::memory_order_relaxed) + 1; }
};

/**
 * @struct TallySnapshot
 * @brief Plain copy of a ResultTally at one point in time.
 */
struct TallySnapshot {
  std::array<size_t, OUTCOME_COUNT> counts{}; //< Indexed by Outcome

  size_t operator[](Outcome outcome) const {
    return counts[static_cast<size_t>(outcome)];
  }
  void add(Outcome outcome, size_t n = 1) {
    counts[static_cast<size_t>(outcome)] += n;
  }
  size_t total() const {
    return counts[0] + counts[1] + counts[2] + counts[3];
  }
};

/**
 * @class ResultTally
 * @brief Outcome counters shared by all workers.
 * @note Each counter sits on its own cache line; record() is a single
 *       atomic increment, so workers never contend on a lock here.
 */
class ResultTally {
  std::array<PaddedAtomic<size_t>, OUTCOME_COUNT> counters_;

public:
  void record(Outcome outcome) {
    ++counters_[static_cast<size_t>(outcome)];
  }

  void reset() {
    for (auto &counter : counters_) {
      counter.store(0);
    }
  }

  TallySnapshot snapshot() const {
    TallySnapshot snap;
    for (size_t i = 0; i < OUTCOME_COUNT; ++i) {
      snap.counts[i] = counters_[i].load();
    }
    return snap;
  }
};

/**
 * @struct JobReport
 * @brief Structured record of one finished job for the log sinks.
 */
struct JobReport {
  Job job;                                //< The job that ran
  Outcome outcome;                        //< Its tallied outcome
  double duration_sec = 0.0;              //< Wall time spent on the job
  std::optional<uintmax_t> source_bytes;  //< Source size, if readable
  std::optional<uintmax_t> dest_bytes;    //< Destination size, if present
  std::string detail;                     //< Reason for skip/failure
};

} // namespace flac2opus

#endif // FLAC2OPUS_TYPES_HPP
