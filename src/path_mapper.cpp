/**
 * @file path_mapper.cpp
 * @brief Source to destination path mapping implementation
 */

#include "flac2opus/path_mapper.hpp"

#include <fmt/core.h>

#include "flac2opus/errors.hpp"

namespace flac2opus {

namespace fs = std::filesystem;

fs::path map_destination(const fs::path &source, const fs::path &source_root,
                         const fs::path &destination_root, JobKind kind,
                         const std::string &target_ext) {
  fs::path rel =
      source.lexically_normal().lexically_relative(source_root.lexically_normal());

  /// Empty: unrelated roots. "." : the root itself. "..": escapes the root
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw PathError(fmt::format("'{}' is not under source root '{}'",
                                source.string(), source_root.string()));
  }

  if (kind == JobKind::Transcode) {
    rel.replace_extension(target_ext);
  }
  return destination_root / rel;
}

} // namespace flac2opus
