/**
 * @file file_classifier.hpp
 * @brief Source tree traversal and transcode/copy partitioning
 */

#ifndef FLAC2OPUS_FILE_CLASSIFIER_HPP
#define FLAC2OPUS_FILE_CLASSIFIER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace flac2opus {

/**
 * @struct Classification
 * @brief Regular files under a root, split by extension.
 * @note Both lists are sorted lexicographically and are disjoint.
 *       Symlinks and directories appear in neither.
 */
struct Classification {
  std::vector<std::filesystem::path> transcode; //< Extension matched
  std::vector<std::filesystem::path> copy;      //< Everything else
};

/**
 * @brief Case-insensitive extension comparison.
 * @param path File whose extension is tested
 * @param extension Extension including the leading dot, e.g. ".flac"
 */
bool has_extension(const std::filesystem::path &path,
                   const std::string &extension);

/**
 * @brief Walk root recursively and partition its regular files.
 *
 * @param root Directory to traverse
 * @param transcode_ext Extension selecting transcode candidates
 * @return Sorted, disjoint transcode and copy lists
 * @throws std::filesystem::filesystem_error if root cannot be opened
 */
Classification classify_files(const std::filesystem::path &root,
                              const std::string &transcode_ext);

} // namespace flac2opus

#endif // FLAC2OPUS_FILE_CLASSIFIER_HPP
