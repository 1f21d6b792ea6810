/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables,
 *          and the RunSettings value that one batch run is driven by.
 *          Command-line flags (see cli_options.hpp) override the
 *          environment defaults.
 *
 */

#ifndef FLAC2OPUS_CONFIG_HPP
#define FLAC2OPUS_CONFIG_HPP

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace flac2opus {
namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable contents or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Parsed integer value or default
 * @throws ConfigError if the value is not a whole integer
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Parsed double value or default
 * @throws ConfigError if the value is not a number
 */
double get_env_double(const char *name, double default_val);

/// External encoder executable (bare name is looked up on PATH)
inline std::string encoder_binary() {
  static std::string val = get_env_string("ENCODER_BINARY", "opusenc");
  return val;
}

/// Extension that selects files for transcoding (matched case-insensitively)
inline std::string source_extension() {
  static std::string val = get_env_string("SOURCE_EXTENSION", ".flac");
  return val;
}

/// Extension given to transcoded outputs
inline std::string target_extension() {
  static std::string val = get_env_string("TARGET_EXTENSION", ".opus");
  return val;
}

/// Bitrate used when none is given on the command line
inline std::string default_bitrate() {
  static std::string val = get_env_string("DEFAULT_BITRATE", "192k");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of parallel encoder jobs when --jobs is absent
 * @note 0 = auto-detect based on available CPUs (cgroup aware).
 *       1 = strictly sequential, no worker threads.
 */
inline int parallel_jobs() {
  static int val = get_env_int("PARALLEL_JOBS", 0);
  return val;
}

/**
 * @brief Seconds to wait after SIGTERM before an encoder is SIGKILLed
 * @note Applies only while cancelling a run.
 */
inline double terminate_grace_sec() {
  static double val = get_env_double("TERMINATE_GRACE_SEC", 5.0);
  return val;
}

} // namespace Config

/**
 * @struct RunSettings
 * @brief Everything one batch run needs, resolved before it starts.
 */
struct RunSettings {
  std::filesystem::path source_dir;
  std::filesystem::path dest_dir;
  std::string bitrate = Config::default_bitrate();
  std::string encoder = Config::encoder_binary();
  std::string source_ext = Config::source_extension();
  std::string target_ext = Config::target_extension();
  int jobs = Config::parallel_jobs(); //< 0 = auto-detect
  bool dry_run = false;
  bool verbose = false;
  std::chrono::milliseconds terminate_grace{
      static_cast<long>(Config::terminate_grace_sec() * 1000.0)};
};

/**
 * @brief Check a bitrate argument against the `<digits>k` form.
 * @throws ConfigError when the value is malformed
 */
void validate_bitrate(const std::string &bitrate);

} // namespace flac2opus

#endif // FLAC2OPUS_CONFIG_HPP
