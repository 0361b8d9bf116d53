/**
 * @file reference_source.hpp
 * @brief Sources of the cache versions currently used by the scene.
 */

#pragma once

#include "version_matcher.hpp"
#include <filesystem>
#include <vector>

namespace FxCacheManager {

/**
 * @brief Supplies the (identifier, version) pairs read by live scene nodes.
 *
 * Implementations are expected to have already filtered the scene down to
 * cache-reading node types.
 */
class ActiveReferenceSource {
public:
    virtual ~ActiveReferenceSource() = default;
    virtual std::vector<VersionReference> activeReferences() = 0;
};

/**
 * @brief Reads references from a JSON export of the scene.
 *
 * The file holds an array of objects. Each needs an identifier and a
 * version; the scene's own parameter name "basename" is accepted for the
 * identifier, and versions may be strings or integers:
 *
 * @code
 * [
 *   { "identifier": "shot010", "version": 3 },
 *   { "basename": "smoke_sim", "version": "12" }
 * ]
 * @endcode
 *
 * The file is re-read on every call so a refresh picks up a new export.
 * A missing or malformed file yields no references.
 */
class JsonReferenceFile : public ActiveReferenceSource {
public:
    explicit JsonReferenceFile(std::filesystem::path path);

    std::vector<VersionReference> activeReferences() override;

    const std::filesystem::path& path() const { return m_path; }
    void setPath(std::filesystem::path path) { m_path = std::move(path); }

private:
    std::filesystem::path m_path;
};

} // namespace FxCacheManager
