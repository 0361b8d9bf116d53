/**
 * @file tree_builder.hpp
 * @brief Parallel directory walker that materializes the cache tree.
 */

#pragma once

#include "cache_node.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace FxCacheManager {

/**
 * @brief Thrown when the cache root to scan does not exist.
 */
class RootNotFoundError : public std::runtime_error {
public:
    explicit RootNotFoundError(const std::filesystem::path& root)
        : std::runtime_error("Cache root not found: " + root.string()), m_root(root) {}

    const std::filesystem::path& root() const { return m_root; }

private:
    std::filesystem::path m_root;
};

/**
 * @brief Builds a CacheNode tree from the directories under a cache root.
 *
 * Every subdirectory becomes a node. A node whose directory has no
 * subdirectories of its own is a Leaf; only leaves read the sidecar
 * metadata and measure their size directly, while branch sizes are the
 * sum of their files and children.
 *
 * The immediate children of the root are handed out to a pool of worker
 * threads. Each worker fills in the subtrees it claims and touches no
 * other node, so no locking is needed. build() returns only after every
 * worker has finished.
 *
 * @par Usage Example:
 * @code
 * TreeBuilder builder;               // one worker per hardware thread
 * CacheNode tree = builder.build("/projects/show/cache/sh010");
 * for (const auto& context : tree.children) {
 *     std::cout << context.name << " " << context.children.size() << "\n";
 * }
 * @endcode
 *
 * @note Symbolic links to directories are followed like directories.
 *       Loops are not detected; recursion stops at kMaxDepth instead.
 */
class TreeBuilder {
public:
    /// Deepest level below the root that will be descended into
    static constexpr int kMaxDepth = 64;

    /**
     * @param workerCount Threads used for the top-level fan-out.
     *        0 selects std::thread::hardware_concurrency().
     */
    explicit TreeBuilder(unsigned workerCount = 0);

    /**
     * @brief Scan a cache root.
     *
     * @param root Directory to scan
     * @return Implicit root node (empty name) holding the whole tree
     * @throws RootNotFoundError if root is missing or not a directory
     */
    CacheNode build(const std::filesystem::path& root) const;

    /**
     * @brief Number of worker threads used for the top-level fan-out.
     */
    unsigned workerCount() const { return m_workerCount; }

    /**
     * @brief Check whether a directory contains at least one subdirectory.
     *
     * Looks one level deep only. An unreadable or vanished directory
     * counts as having none.
     */
    static bool hasSubdirectories(const std::filesystem::path& directory);

private:
    void populate(CacheNode& node, const std::filesystem::path& directory, int depth) const;
    std::vector<CacheNode> listChildren(const CacheNode& parent, const std::filesystem::path& directory) const;

    unsigned m_workerCount;     ///< Top-level fan-out threads
};

} // namespace FxCacheManager
