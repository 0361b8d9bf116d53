/**
 * @file cache_node.hpp
 * @brief In-memory model of the scanned cache directory tree.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace FxCacheManager {

/**
 * @brief Classification of a cache directory.
 *
 * A directory is a Leaf when it has no directory children at scan time.
 * Files inside the directory do not affect the classification.
 */
enum class NodeKind {
    Branch,     ///< Has at least one subdirectory (context or element level)
    Leaf        ///< No subdirectories (a cached version)
};

/**
 * @brief One directory in the cache tree.
 *
 * Nodes own their children by value. The tree carries no parent pointers;
 * every node stores the segments leading to it from the cache root so the
 * absolute path can be rebuilt against whatever root is current.
 *
 * @par Layout:
 * @code
 * <cache root>/
 *   shot010/          Branch (context)
 *     smoke/          Branch (element)
 *       v001/         Leaf   (version, holds cacheinfo.json)
 *       v002/         Leaf
 * @endcode
 */
struct CacheNode {
    std::string name;                               ///< Directory base name (empty for the root)
    NodeKind kind = NodeKind::Leaf;                 ///< Leaf/Branch at scan time
    std::vector<CacheNode> children;                ///< Subdirectories, sorted by name
    std::uintmax_t size = 0;                        ///< Bytes of all files under this node
    std::filesystem::file_time_type modifiedTime;   ///< Directory mtime at scan time
    std::string comment;                            ///< Sidecar comment (Leaf only)
    bool isProtected = false;                       ///< Sidecar protection flag (Leaf only)
    std::vector<std::string> relativePath;          ///< Segments from the cache root
    bool inUse = false;                             ///< Referenced by the scene graph

    bool isLeaf() const { return kind == NodeKind::Leaf; }
    bool isRoot() const { return relativePath.empty(); }

    /**
     * @brief Stable identifier of the node: segments joined with '/'.
     * @return "shot010/smoke/v001" style id, empty for the root
     */
    std::string id() const;

    /**
     * @brief Rebuild the absolute directory path.
     * @param cacheRoot Current cache root
     * @return cacheRoot joined with every relativePath segment
     */
    std::filesystem::path absolutePath(const std::filesystem::path& cacheRoot) const;
};

/// @name Tree helpers
/// @{

/**
 * @brief Split a node id back into path segments.
 *
 * Empty segments (leading, trailing or doubled slashes) are dropped.
 */
std::vector<std::string> splitNodeId(const std::string& id);

/**
 * @brief Find a node by id.
 * @return Pointer into the tree, or nullptr if no node has that id
 */
CacheNode* findNode(CacheNode& root, const std::string& id);
const CacheNode* findNode(const CacheNode& root, const std::string& id);

/**
 * @brief Remove the node with the given id from its parent.
 * @return true if a node was erased
 */
bool eraseNode(CacheNode& root, const std::string& id);

/**
 * @brief Visit every Leaf with its parent (nullptr for leaves under no parent).
 */
void forEachLeaf(CacheNode& root, const std::function<void(CacheNode& leaf, const CacheNode* parent)>& visitor);

/**
 * @brief Count nodes of the tree, excluding the root.
 */
std::size_t countNodes(const CacheNode& root);

/// @}

} // namespace FxCacheManager
