/**
 * @file errors.hpp
 * @brief Exception types that cross module boundaries
 *
 * @details Only two failures are reported as exceptions:
 *
 *          - ConfigError: fatal, raised before any job is scheduled
 *
 *          - PathError: path mapping invariant violation, fatal for one
 *            job only and converted to a Failed outcome by the planner
 *
 *          Everything else that can go wrong inside a job (encoder start
 *          or exit failure, copy errors) is a value, never an exception.
 */

#ifndef FLAC2OPUS_ERRORS_HPP
#define FLAC2OPUS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace flac2opus {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

class PathError : public std::runtime_error {
public:
  explicit PathError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace flac2opus

#endif // FLAC2OPUS_ERRORS_HPP
