/**
 * @file config.cpp
 * @brief Environment parsing and run settings validation
 */

#include "flac2opus/config.hpp"

#include <cstdlib>
#include <exception>
#include <regex>
#include <string>

#include <fmt/core.h>

#include "flac2opus/errors.hpp"

namespace flac2opus {

namespace Config {

namespace {

/// Parse the whole of text with parse(text, &consumed)
template <typename T, typename Parse>
T parse_env_value(const char *name, const std::string &text, Parse parse) {
  size_t consumed = 0;
  T value{};
  try {
    value = parse(text, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw ConfigError(
        fmt::format("Invalid value '{}' for environment variable {}.", text,
                    name));
  }
  return value;
}

} // anonymous namespace

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  return parse_env_value<int>(name, val, [](const std::string &s, size_t *pos) {
    return std::stoi(s, pos);
  });
}

double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  return parse_env_value<double>(
      name, val,
      [](const std::string &s, size_t *pos) { return std::stod(s, pos); });
}

} // namespace Config

void validate_bitrate(const std::string &bitrate) {
  static const std::regex bitrate_re("^[0-9]+k$");
  if (!std::regex_match(bitrate, bitrate_re)) {
    throw ConfigError(fmt::format(
        "Invalid bitrate format '{}'. Expected something like '192k'.",
        bitrate));
  }
}

} // namespace flac2opus
