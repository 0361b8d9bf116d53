/**
 * @file version_matcher.hpp
 * @brief Flags cached versions that are referenced by the open scene.
 */

#pragma once

#include "cache_node.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FxCacheManager {

/**
 * @brief A cache read by a node in the scene graph.
 *
 * The version is kept as a string; numeric versions coming from the
 * scene are rendered as decimal text before they get here.
 */
struct VersionReference {
    std::string identifier;     ///< Cache base name, e.g. "shot010"
    std::string version;        ///< Version number as text, e.g. "3"
};

/**
 * @brief Matches scene references against the leaves of a cache tree.
 *
 * A leaf's identifier is the name of its parent directory and its version
 * is its own name with the version prefix removed:
 *
 * @code
 * shot010/v003   → ("shot010", "3")
 * shot010/v004   → ("shot010", "4")
 * shot010/latest → no version, never matches
 * @endcode
 *
 * Matching only ever sets inUse flags to true, so running it
 * several times with overlapping references gives the same result.
 */
class VersionMatcher {
public:
    /// Prefix expected in front of the digits of a version directory
    static constexpr char kVersionPrefix = 'v';

    /**
     * @brief Extract the version number from a version directory name.
     *
     * Removes the one-character 'v'/'V' prefix and requires the rest to be
     * decimal digits. Leading zeros are dropped.
     *
     * @return "3" for "v003", "0" for "v000", std::nullopt for names such as
     *         "v", "003", "v1a" or "take3"
     */
    static std::optional<std::string> parseVersionName(std::string_view name);

    /**
     * @brief Render a reference version as a plain decimal string.
     *
     * @return "3" for "3" or "003", std::nullopt if not all digits
     */
    static std::optional<std::string> normalizeVersion(std::string_view version);

    /**
     * @brief Set inUse on every leaf matched by at least one reference.
     *
     * Leaves directly below the root have no identifier and are skipped.
     * Existing inUse flags are left as they are.
     *
     * @return Number of leaves that matched
     */
    static std::size_t match(CacheNode& tree, const std::vector<VersionReference>& references);

    /**
     * @brief Reset inUse on every node.
     */
    static void clear(CacheNode& tree);
};

} // namespace FxCacheManager
