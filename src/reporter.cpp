/**
 * @file reporter.cpp
 * @brief Run summary rendering
 */

#include "flac2opus/reporter.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

#include "flac2opus/system.hpp"

namespace flac2opus {

namespace {

constexpr const char *RULE =
    "======================================================";

void append_row(std::string &out, const std::string &metric,
                const std::string &value) {
  out += fmt::format("{:<30} {:>23}\n", metric, value);
}

} // anonymous namespace

std::string render_summary(const RunSummary &summary) {
  std::string out;
  out.reserve(1024);

  out += "\n============== TRANSCODING SUMMARY ===================\n";
  append_row(out, "Total source files found:",
             std::to_string(summary.transcode_found));
  append_row(out, "Successfully transcoded:",
             std::to_string(summary.transcode[Outcome::Success]));
  append_row(out, "Failed to transcode:",
             std::to_string(summary.transcode[Outcome::Failed]));
  append_row(out, "Skipped (already up-to-date):",
             std::to_string(summary.transcode[Outcome::Skipped]));
  append_row(out, "Dry-run:", std::to_string(summary.transcode[Outcome::DryRun]));
  append_row(out, "Parallel jobs:", std::to_string(summary.workers));
  append_row(out, "Wall-clock time:", format_time(summary.wall_clock_sec));
  if (!summary.log_file.empty()) {
    out += fmt::format("{:<30} {}\n", "Main log:", summary.log_file.string());
    out += fmt::format("{:<30} {}\n", "Error log:",
                       summary.error_log_file.string());
  }
  if (summary.cancelled) {
    append_row(out, "Status:", "INTERRUPTED");
  }
  out += RULE;
  out += "\n";

  out += "\n============== PASS-THROUGH COPY SUMMARY =============\n";
  append_row(out, "Total other files found:",
             std::to_string(summary.copy_found));
  append_row(out, "Copied:", std::to_string(summary.copy[Outcome::Success]));
  append_row(out, "Skipped (up-to-date):",
             std::to_string(summary.copy[Outcome::Skipped]));
  append_row(out, "Dry-run:", std::to_string(summary.copy[Outcome::DryRun]));
  append_row(out, "Failed:", std::to_string(summary.copy[Outcome::Failed]));
  out += RULE;
  out += "\n";

  return out;
}

void print_summary(const RunSummary &summary, std::FILE *out) {
  fmt::print(out, "{}", render_summary(summary));
  if (summary.cancelled) {
    fmt::print(out, fg(fmt::color::red), "Run was interrupted; results are partial.\n");
  } else if (summary.transcode[Outcome::Failed] + summary.copy[Outcome::Failed] >
             0) {
    fmt::print(out, fg(fmt::color::yellow),
               "Some files failed; see the error log for details.\n");
  } else {
    fmt::print(out, fg(fmt::color::green), "All done!\n");
  }
  std::fflush(out);
}

} // namespace flac2opus
