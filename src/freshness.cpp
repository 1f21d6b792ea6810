/**
 * @file freshness.cpp
 * @brief Freshness check implementation
 */

#include "flac2opus/freshness.hpp"

namespace flac2opus {

namespace fs = std::filesystem;

Freshness check_freshness(const fs::path &source, const fs::path &destination) {
  std::error_code ec;
  if (!fs::exists(destination, ec) || ec)
    return Freshness::NeedsWork;

  auto dest_time = fs::last_write_time(destination, ec);
  if (ec)
    return Freshness::NeedsWork;

  auto src_time = fs::last_write_time(source, ec);
  if (ec)
    return Freshness::NeedsWork;

  return dest_time >= src_time ? Freshness::UpToDate : Freshness::NeedsWork;
}

} // namespace flac2opus
