/**
 * @file main.cpp
 * @brief Entry point for flac2opus
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - One BatchRun over the source tree
 *
 *          - Summary output and exit status
 *
 * @note Exit status is 0 for a completed run even when individual files
 *       failed, and 1 for configuration errors or a cancelled run.
 */

#include <cstdio>
#include <exception>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "flac2opus/batch_run.hpp"
#include "flac2opus/cli_options.hpp"
#include "flac2opus/errors.hpp"
#include "flac2opus/reporter.hpp"

using namespace flac2opus;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::string program = argc > 0 ? argv[0] : "flac2opus";

  try {
    /// RunSettings defaults read the environment and may throw ConfigError
    CliOptions options;
    try {
      options = parse_args(argc, argv);
    } catch (const ConfigError &e) {
      fmt::print(stderr, fg(fmt::color::red), "Error: {}\n", e.what());
      fmt::print(stderr, "{}", usage(program));
      return 1;
    }

    if (options.show_help) {
      fmt::print("{}", usage(program));
      return 0;
    }

    BatchRun batch(options.settings);
    RunSummary summary = batch.run();
    print_summary(summary);
    return summary.exit_code();
  } catch (const ConfigError &e) {
    fmt::print(stderr, fg(fmt::color::red), "Error: {}\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    fmt::print(stderr, fg(fmt::color::red), "Fatal: {}\n", e.what());
    return 1;
  }
}
