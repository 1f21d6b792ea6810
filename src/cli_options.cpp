/**
 * @file cli_options.cpp
 * @brief Command-line parsing implementation
 */

#include "flac2opus/cli_options.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <fmt/core.h>

#include "flac2opus/errors.hpp"

namespace flac2opus {

namespace {

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

int parse_jobs(const std::string &value) {
  int jobs = 0;
  try {
    jobs = std::stoi(value);
  } catch (const std::exception &) {
    throw ConfigError(
        fmt::format("--jobs requires a positive integer, got '{}'.", value));
  }
  if (jobs < 1) {
    throw ConfigError(
        fmt::format("--jobs requires a positive integer, got '{}'.", value));
  }
  return jobs;
}

} // anonymous namespace

CliOptions parse_args(int argc, const char *const argv[]) {
  CliOptions options;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.show_help = true;
      return options;
    } else if (arg == "-v" || arg == "--verbose") {
      options.settings.verbose = true;
    } else if (arg == "-d" || arg == "--dry-run") {
      options.settings.dry_run = true;
    } else if (arg == "-b" || arg == "--bitrate") {
      if (i + 1 >= argc) {
        throw ConfigError(fmt::format("{} requires a value.", arg));
      }
      options.settings.bitrate = argv[++i];
    } else if (arg.rfind("--bitrate=", 0) == 0) {
      options.settings.bitrate = arg.substr(10);
    } else if (arg == "-j" || arg == "--jobs") {
      /// The value is optional: a bare -j means auto-detect
      if (i + 1 < argc && all_digits(argv[i + 1])) {
        options.settings.jobs = parse_jobs(argv[++i]);
      } else {
        options.settings.jobs = 0;
      }
    } else if (arg.rfind("--jobs=", 0) == 0) {
      options.settings.jobs = parse_jobs(arg.substr(7));
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw ConfigError(fmt::format("Unknown option '{}'.", arg));
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() != 2) {
    throw ConfigError("Expected exactly two arguments: <source_dir> <dest_dir>.");
  }
  options.settings.source_dir = positional[0];
  options.settings.dest_dir = positional[1];
  return options;
}

std::string usage(const std::string &program) {
  return fmt::format(
      "Usage: {} <source_dir> <dest_dir> [options]\n"
      "\n"
      "Transcode {} files to {} with an external encoder, mirroring the\n"
      "directory tree and copying every other file through unchanged.\n"
      "\n"
      "Options:\n"
      "  -b, --bitrate B   Encoder bitrate, e.g. 192k (default: {})\n"
      "  -j, --jobs [N]    Parallel jobs; omit N to auto-detect CPU cores\n"
      "  -v, --verbose     Enable verbose output\n"
      "  -d, --dry-run     Report what would be done without doing it\n"
      "  -h, --help        Show this help\n"
      "\n"
      "Environment: ENCODER_BINARY, SOURCE_EXTENSION, TARGET_EXTENSION,\n"
      "             DEFAULT_BITRATE, PARALLEL_JOBS, TERMINATE_GRACE_SEC\n",
      program, Config::source_extension(), Config::target_extension(),
      Config::default_bitrate());
}

} // namespace flac2opus
