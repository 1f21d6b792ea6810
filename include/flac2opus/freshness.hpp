/**
 * @file freshness.hpp
 * @brief Skip-if-up-to-date check on modification times
 */

#ifndef FLAC2OPUS_FRESHNESS_HPP
#define FLAC2OPUS_FRESHNESS_HPP

#include <filesystem>

namespace flac2opus {

enum class Freshness { NeedsWork, UpToDate };

/**
 * @brief Decide whether a destination must be (re)produced.
 *
 * @return UpToDate iff destination exists and its mtime is not older than
 *         the source's; NeedsWork otherwise (including when either mtime
 *         cannot be read)
 * @note Never creates directories; evaluated fresh on every call.
 */
Freshness check_freshness(const std::filesystem::path &source,
                          const std::filesystem::path &destination);

} // namespace flac2opus

#endif // FLAC2OPUS_FRESHNESS_HPP
