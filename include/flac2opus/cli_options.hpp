/**
 * @file cli_options.hpp
 * @brief Command-line parsing into RunSettings
 *
 * @details Usage:
 *
 *          flac2opus <source_dir> <dest_dir> [-b|--bitrate B]
 *                    [-j|--jobs [N]] [-v|--verbose] [-d|--dry-run]
 *                    [-h|--help]
 *
 * @note Values not given on the command line come from the environment
 *       (see config.hpp). The bitrate is only collected here; its syntax
 *       is checked by the run's pre-flight.
 */

#ifndef FLAC2OPUS_CLI_OPTIONS_HPP
#define FLAC2OPUS_CLI_OPTIONS_HPP

#include <string>

#include "config.hpp"

namespace flac2opus {

struct CliOptions {
  RunSettings settings;
  bool show_help = false;
};

/**
 * @brief Parse argv.
 * @throws ConfigError on unknown options, missing values, a non-positive
 *         --jobs value, or missing positional arguments
 */
CliOptions parse_args(int argc, const char *const argv[]);

/// Help text
std::string usage(const std::string &program);

} // namespace flac2opus

#endif // FLAC2OPUS_CLI_OPTIONS_HPP
