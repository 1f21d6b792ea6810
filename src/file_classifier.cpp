/**
 * @file file_classifier.cpp
 * @brief Source tree traversal implementation
 */

#include "flac2opus/file_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace flac2opus {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

bool has_extension(const fs::path &path, const std::string &extension) {
  return to_lower(path.extension().string()) == to_lower(extension);
}

Classification classify_files(const fs::path &root,
                              const std::string &transcode_ext) {
  Classification result;

  /// Unreadable subdirectories are skipped rather than aborting the walk
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied);

  for (const auto &entry : it) {
    std::error_code ec;

    /// symlink_status does not follow links, so links are never "regular"
    if (!fs::is_regular_file(entry.symlink_status(ec)) || ec)
      continue;

    if (has_extension(entry.path(), transcode_ext)) {
      result.transcode.push_back(entry.path());
    } else {
      result.copy.push_back(entry.path());
    }
  }

  std::sort(result.transcode.begin(), result.transcode.end());
  std::sort(result.copy.begin(), result.copy.end());
  return result;
}

} // namespace flac2opus
