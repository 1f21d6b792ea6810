/**
 * @file path_mapper.hpp
 * @brief Source to destination path mapping
 */

#ifndef FLAC2OPUS_PATH_MAPPER_HPP
#define FLAC2OPUS_PATH_MAPPER_HPP

#include <filesystem>
#include <string>

#include "types.hpp"

namespace flac2opus {

/**
 * @brief Compute where a source file lands in the destination tree.
 *
 * @details destination_root / relative(source, source_root), with the
 *          extension replaced by target_ext for Transcode jobs. Copy jobs
 *          keep their file name.
 *
 * @param source File under source_root
 * @param source_root Root of the source tree
 * @param destination_root Root of the destination tree
 * @param kind Job kind deciding whether the extension changes
 * @param target_ext Extension for transcoded outputs, e.g. ".opus"
 * @return Destination path
 * @throws PathError if source is not contained under source_root
 */
std::filesystem::path map_destination(const std::filesystem::path &source,
                                      const std::filesystem::path &source_root,
                                      const std::filesystem::path &destination_root,
                                      JobKind kind,
                                      const std::string &target_ext);

} // namespace flac2opus

#endif // FLAC2OPUS_PATH_MAPPER_HPP
