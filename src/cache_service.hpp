/**
 * @file cache_service.hpp
 * @brief Owns the cache tree and exposes refresh/query/delete to the UI.
 */

#pragma once

#include "cache_node.hpp"
#include "cache_root.hpp"
#include "deletion_policy.hpp"
#include "metadata_store.hpp"
#include "reference_source.hpp"
#include "tree_builder.hpp"
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace FxCacheManager {

/**
 * @brief One display row of the cache tree.
 *
 * Rows are plain snapshots; the presentation layer never holds on to
 * CacheNode objects.
 */
struct CacheRow {
    std::string id;                 ///< Node id, used for selection and deletion
    std::string name;               ///< Directory name
    int depth = 0;                  ///< 0 for children of the cache root
    bool isLeaf = false;
    bool hasChildren = false;
    std::string comment;
    std::string formattedSize;      ///< e.g. "1.5 GB"
    std::string formattedDate;      ///< e.g. "03-14  18:02"
    bool inUse = false;             ///< Referenced by the scene
    bool isProtected = false;       ///< Not selectable or deletable
};

/**
 * @brief Orchestrates scanning, matching and deletion of cached versions.
 *
 * The service resolves the cache root once per session, rebuilds the whole
 * tree on refresh(), flags versions used by the scene and applies the
 * DeletionPolicy for deletions. Refresh and delete share one mutex, so a
 * deletion never runs against a half-built tree and a refresh never
 * starts while a deletion is in flight.
 *
 * Listeners registered with setTreeChangedCallback() are notified after
 * every refresh, deletion or metadata edit and should re-read rows().
 *
 * @par Usage Example:
 * @code
 * CacheService service(resolver, references);
 * service.refresh();
 * for (const auto& row : service.rows()) {
 *     std::cout << std::string(row.depth * 2, ' ') << row.name << "\n";
 * }
 * service.select("shot010/smoke/v001");
 * for (const auto& outcome : service.deleteSelected()) {
 *     std::cout << outcome.message << "\n";
 * }
 * @endcode
 */
class CacheService {
public:
    using TreeChangedCallback = std::function<void()>;

    /**
     * @param resolver Supplies the cache root on first use
     * @param references Queried for in-use versions on every refresh
     * @param workerCount Scan threads (0 = hardware concurrency)
     */
    CacheService(CacheRootResolver& resolver, ActiveReferenceSource& references, unsigned workerCount = 0);

    /**
     * @brief Rebuild the tree from disk and re-match in-use versions.
     *
     * A missing cache root is created and scanned once more.
     *
     * @throws CacheRootUnresolvedError if no root could be resolved
     * @throws RootNotFoundError if the root is still missing after creating it
     */
    void refresh();

    /**
     * @brief Resolve (once) and return the cache root.
     * @throws CacheRootUnresolvedError if no root could be resolved
     */
    std::filesystem::path resolveCacheRoot();

    /**
     * @brief Cache root resolved so far, empty before the first resolve.
     */
    std::filesystem::path cacheRoot() const;

    /// @name Queries
    /// @{
    bool hasTree() const;
    CacheNode snapshot() const;
    std::vector<CacheRow> rows() const;
    /// @}

    /// @name Selection
    /// @{

    /**
     * @brief Add a node to the selection.
     * @return false if the node does not exist or is protected
     */
    bool select(const std::string& nodeId);
    void deselect(const std::string& nodeId);
    void clearSelection();
    bool isSelected(const std::string& nodeId) const;
    std::vector<std::string> selection() const;
    /// @}

    /// @name Mutation
    /// @{

    /**
     * @brief Delete every selected node.
     * @return One outcome per selected node
     */
    std::vector<DeletionOutcome> deleteSelected();

    /**
     * @brief Delete the given nodes independently of the selection.
     */
    std::vector<DeletionOutcome> deleteNodes(const std::vector<std::string>& nodeIds);

    /**
     * @brief Write a leaf's sidecar and update the in-memory node.
     * @return false for unknown or branch nodes, or if the write failed
     */
    bool updateMetadata(const std::string& nodeId, const CacheMetadata& metadata);
    /// @}

    /**
     * @brief Shell command that opens the cache root in the file manager.
     *
     * The command is only built here; running it is up to the caller.
     * On POSIX the path is single-quoted so no character in it is
     * interpreted by the shell.
     * @return Empty string if the cache root is not resolved yet
     */
    std::string openCacheFolderCommand() const;

    void setTreeChangedCallback(TreeChangedCallback callback);

private:
    std::filesystem::path resolveCacheRootLocked();
    std::vector<DeletionOutcome> deleteNodesLocked(const std::vector<std::string>& nodeIds);
    void pruneSelectionLocked();
    void notifyTreeChanged();

    CacheRootResolver& m_resolver;
    ActiveReferenceSource& m_references;
    TreeBuilder m_builder;

    mutable std::mutex m_mutex;             ///< Serializes refresh, delete and edits
    std::filesystem::path m_cacheRoot;      ///< Resolved once per session
    CacheNode m_tree;                       ///< Canonical tree
    bool m_hasTree = false;
    std::set<std::string> m_selection;      ///< Selected node ids

    std::mutex m_callbackMutex;
    TreeChangedCallback m_treeChangedCallback;
};

} // namespace FxCacheManager
