/**
 * @file reporter.hpp
 * @brief Final run summary tables
 */

#ifndef FLAC2OPUS_REPORTER_HPP
#define FLAC2OPUS_REPORTER_HPP

#include <cstdio>
#include <filesystem>
#include <string>

#include "types.hpp"

namespace flac2opus {

/**
 * @struct RunSummary
 * @brief Aggregate results of one batch run.
 */
struct RunSummary {
  size_t transcode_found = 0; //< Transcode candidates discovered
  size_t copy_found = 0;      //< Pass-through files discovered
  TallySnapshot transcode;    //< Outcomes of the transcode phase
  TallySnapshot copy;         //< Outcomes of the copy phase
  int workers = 1;            //< Worker count used
  double wall_clock_sec = 0;  //< Elapsed time of the whole run
  bool cancelled = false;     //< Run was interrupted
  std::filesystem::path log_file;
  std::filesystem::path error_log_file;

  /// 0 for a completed run (even with failures), 1 when cancelled
  int exit_code() const { return cancelled ? 1 : 0; }
};

/**
 * @brief Render the transcode and pass-through tables as text.
 */
std::string render_summary(const RunSummary &summary);

/**
 * @brief Print render_summary() to out.
 */
void print_summary(const RunSummary &summary, std::FILE *out = stdout);

} // namespace flac2opus

#endif // FLAC2OPUS_REPORTER_HPP
