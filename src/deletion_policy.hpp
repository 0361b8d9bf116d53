/**
 * @file deletion_policy.hpp
 * @brief Guarded removal of cached versions from disk and from the tree.
 */

#pragma once

#include "cache_node.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace FxCacheManager {

/**
 * @brief Result of a single deletion attempt.
 */
enum class DeletionStatus {
    Deleted,            ///< Directory removed and node erased
    NotLeaf,            ///< Node has subdirectories; nothing was touched
    AlreadyDeleted,     ///< Directory was already gone; stale node erased
    Protected,          ///< Sidecar has cache_protect set; nothing was touched
    UnknownNode,        ///< No node with that id in the tree
    IoError             ///< Filesystem refused the removal
};

/**
 * @brief Outcome of deleting one node, as reported to the user.
 */
struct DeletionOutcome {
    std::string nodeId;                 ///< Id of the node that was requested
    DeletionStatus status = DeletionStatus::Deleted;
    std::string message;                ///< Human-readable explanation

    bool succeeded() const { return status == DeletionStatus::Deleted; }
};

/**
 * @brief Short label for a status ("deleted", "not a leaf", ...).
 */
const char* toString(DeletionStatus status);

/**
 * @brief Validates and performs deletion of leaf directories.
 *
 * Every check is made against the live state at the moment of deletion,
 * not against what the last scan recorded:
 * 1. The absolute path is rebuilt from the cache root and the node's
 *    relative path.
 * 2. The node must have no children in the tree and its directory no
 *    subdirectories on disk, otherwise NotLeaf.
 * 3. A directory that no longer exists gives AlreadyDeleted.
 * 4. A sidecar that currently says cache_protect gives Protected.
 * 5. The directory is removed recursively and the node is erased from
 *    its parent.
 *
 * Nothing is ever partially deleted: a node that fails a check is left
 * exactly as it was.
 */
class DeletionPolicy {
public:
    explicit DeletionPolicy(std::filesystem::path cacheRoot);

    /**
     * @brief Delete one node.
     * @param tree Tree the node belongs to (mutated on success)
     * @param nodeId Id of the node (see CacheNode::id())
     */
    DeletionOutcome remove(CacheNode& tree, const std::string& nodeId) const;

    /**
     * @brief Delete several nodes independently.
     *
     * A failure on one node does not stop the others.
     *
     * @return One outcome per requested id, in request order
     */
    std::vector<DeletionOutcome> removeAll(CacheNode& tree, const std::vector<std::string>& nodeIds) const;

    const std::filesystem::path& cacheRoot() const { return m_cacheRoot; }

private:
    std::filesystem::path m_cacheRoot;
};

} // namespace FxCacheManager
