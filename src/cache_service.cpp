#include "cache_service.hpp"
#include "debug.hpp"
#include "size_aggregator.hpp"
#include "version_matcher.hpp"

namespace FxCacheManager {

namespace {

void appendRows(const CacheNode& node, std::vector<CacheRow>& rows) {
    for (const auto& child : node.children) {
        CacheRow row;
        row.id = child.id();
        row.name = child.name;
        row.depth = static_cast<int>(child.relativePath.size()) - 1;
        row.isLeaf = child.isLeaf();
        row.hasChildren = !child.children.empty();
        row.comment = child.comment;
        row.formattedSize = SizeAggregator::formatSize(child.size);
        row.formattedDate = SizeAggregator::formatDate(child.modifiedTime);
        row.inUse = child.inUse;
        row.isProtected = child.isProtected;
        rows.push_back(std::move(row));

        appendRows(child, rows);
    }
}

} // namespace

CacheService::CacheService(CacheRootResolver& resolver, ActiveReferenceSource& references, unsigned workerCount)
    : m_resolver(resolver)
    , m_references(references)
    , m_builder(workerCount) {}

std::filesystem::path CacheService::resolveCacheRootLocked() {
    if (m_cacheRoot.empty()) {
        m_cacheRoot = m_resolver.resolve();
        DEBUG_LOG("Cache root for this session: " << m_cacheRoot.string());
    }
    return m_cacheRoot;
}

std::filesystem::path CacheService::resolveCacheRoot() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return resolveCacheRootLocked();
}

std::filesystem::path CacheService::cacheRoot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cacheRoot;
}

void CacheService::refresh() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ScopedTimer timer("CacheService::refresh", 1000);
        std::filesystem::path root = resolveCacheRootLocked();

        CacheNode tree;
        try {
            tree = m_builder.build(root);
        } catch (const RootNotFoundError& e) {
            WARN_LOG(e.what() << ", creating it");
            std::error_code ec;
            std::filesystem::create_directories(root, ec);
            if (ec) {
                WARN_LOG("Could not create " << root.string() << ": " << ec.message());
            }
            // A second failure goes to the caller
            tree = m_builder.build(root);
        }

        VersionMatcher::match(tree, m_references.activeReferences());

        m_tree = std::move(tree);
        m_hasTree = true;
        pruneSelectionLocked();

        DEBUG_LOG("Tree populated in " << timer.elapsedMs() << "ms");
    }
    notifyTreeChanged();
}

bool CacheService::hasTree() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hasTree;
}

CacheNode CacheService::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tree;
}

std::vector<CacheRow> CacheService::rows() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CacheRow> result;
    if (m_hasTree) {
        result.reserve(countNodes(m_tree));
        appendRows(m_tree, result);
    }
    return result;
}

bool CacheService::select(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const CacheNode* node = findNode(m_tree, nodeId);
    if (!m_hasTree || !node || node->isRoot() || node->isProtected) {
        return false;
    }
    m_selection.insert(nodeId);
    return true;
}

void CacheService::deselect(const std::string& nodeId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_selection.erase(nodeId);
}

void CacheService::clearSelection() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_selection.clear();
}

bool CacheService::isSelected(const std::string& nodeId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_selection.count(nodeId) > 0;
}

std::vector<std::string> CacheService::selection() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_selection.begin(), m_selection.end());
}

void CacheService::pruneSelectionLocked() {
    for (auto it = m_selection.begin(); it != m_selection.end();) {
        const CacheNode* node = findNode(m_tree, *it);
        if (!node || node->isProtected) {
            it = m_selection.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<DeletionOutcome> CacheService::deleteNodesLocked(const std::vector<std::string>& nodeIds) {
    if (!m_hasTree) {
        std::vector<DeletionOutcome> outcomes;
        for (const auto& id : nodeIds) {
            outcomes.push_back({id, DeletionStatus::UnknownNode, "Cache tree has not been scanned yet"});
        }
        return outcomes;
    }

    DeletionPolicy policy(m_cacheRoot);
    auto outcomes = policy.removeAll(m_tree, nodeIds);

    size_t deleted = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            ++deleted;
        }
    }
    pruneSelectionLocked();
    DEBUG_LOG("Deleted " << deleted << " of " << outcomes.size() << " requested cache folders");
    return outcomes;
}

std::vector<DeletionOutcome> CacheService::deleteSelected() {
    std::vector<DeletionOutcome> outcomes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> ids(m_selection.begin(), m_selection.end());
        outcomes = deleteNodesLocked(ids);
    }
    notifyTreeChanged();
    return outcomes;
}

std::vector<DeletionOutcome> CacheService::deleteNodes(const std::vector<std::string>& nodeIds) {
    std::vector<DeletionOutcome> outcomes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        outcomes = deleteNodesLocked(nodeIds);
    }
    notifyTreeChanged();
    return outcomes;
}

bool CacheService::updateMetadata(const std::string& nodeId, const CacheMetadata& metadata) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        CacheNode* node = m_hasTree ? findNode(m_tree, nodeId) : nullptr;
        if (!node || node->isRoot() || !node->isLeaf()) {
            return false;
        }
        if (!MetadataStore::write(node->absolutePath(m_cacheRoot), metadata)) {
            return false;
        }
        node->comment = metadata.comment;
        node->isProtected = metadata.isProtected;
        pruneSelectionLocked();
    }
    notifyTreeChanged();
    return true;
}

std::string CacheService::openCacheFolderCommand() const {
    std::filesystem::path root = cacheRoot();
    if (root.empty()) {
        return "";
    }
#if defined(_WIN32)
    return "explorer \"" + root.string() + "\"";
#else
    // Nothing is special inside single quotes; an embedded ' becomes '\''
    std::string quoted = "'";
    for (char c : root.string()) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
#if defined(__APPLE__)
    return "open " + quoted;
#else
    return "xdg-open " + quoted + " &";
#endif
#endif
}

void CacheService::setTreeChangedCallback(TreeChangedCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_treeChangedCallback = std::move(callback);
}

void CacheService::notifyTreeChanged() {
    TreeChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        callback = m_treeChangedCallback;
    }
    if (callback) {
        callback();
    }
}

} // namespace FxCacheManager
