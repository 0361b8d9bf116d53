/**
 * @file metadata_store.hpp
 * @brief Sidecar metadata (comment, protection) stored beside each cached version.
 */

#pragma once

#include <filesystem>
#include <string>

namespace FxCacheManager {

/**
 * @brief Contents of a version's sidecar file.
 *
 * Missing keys take these defaults, as does a missing or unreadable file.
 */
struct CacheMetadata {
    std::string comment;            ///< Free-text note entered by the artist
    bool isProtected = false;       ///< "cache_protect": 1 blocks deletion
};

/**
 * @brief Reads and writes the per-version `cacheinfo.json` sidecar.
 *
 * The sidecar is a small JSON object written by the caching pipeline:
 * @code
 * { "comment": "approved for comp", "cache_protect": 1 }
 * @endcode
 *
 * Metadata is advisory. Every read falls back to the defaults in
 * CacheMetadata instead of reporting an error, so a tree can always be
 * built even when sidecars are missing or corrupt.
 */
class MetadataStore {
public:
    static constexpr const char* kSidecarName = "cacheinfo.json";

    /**
     * @brief Read both fields with a single file parse.
     * @param versionDir Leaf directory holding the sidecar
     */
    static CacheMetadata read(const std::filesystem::path& versionDir);

    /**
     * @brief Read the comment, or "" if unavailable.
     */
    static std::string readComment(const std::filesystem::path& versionDir);

    /**
     * @brief Read the protection flag, or false if unavailable.
     */
    static bool readProtection(const std::filesystem::path& versionDir);

    /**
     * @brief Store comment and protection flag.
     *
     * Keys already present in the sidecar that this tool does not know
     * about are preserved. The new content goes to a temporary file that
     * is renamed over the sidecar, so a failed write leaves the previous
     * sidecar intact. Invalid UTF-8 in the comment is stored as U+FFFD.
     *
     * @return false if the file could not be written
     */
    static bool write(const std::filesystem::path& versionDir, const CacheMetadata& metadata);

    /**
     * @brief Full path of the sidecar inside a version directory.
     */
    static std::filesystem::path sidecarPath(const std::filesystem::path& versionDir) {
        return versionDir / kSidecarName;
    }
};

} // namespace FxCacheManager
