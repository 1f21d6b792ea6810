/**
 * @file types.cpp
 * @brief Out-of-line helpers for core data types
 */

#include "flac2opus/types.hpp"

namespace flac2opus {

const char *outcome_name(Outcome outcome) {
  switch (outcome) {
  case Outcome::Success:
    return "success";
  case Outcome::Failed:
    return "failed";
  case Outcome::Skipped:
    return "skipped";
  case Outcome::DryRun:
    return "dry-run";
  }
  return "unknown";
}

} // namespace flac2opus
