#include "deletion_policy.hpp"
#include <algorithm>
#include "debug.hpp"
#include "metadata_store.hpp"
#include "size_aggregator.hpp"
#include "tree_builder.hpp"

namespace FxCacheManager {

namespace {

// Replace a node's contribution to every enclosing branch, root included
void adjustAncestorSizes(CacheNode& tree, const std::vector<std::string>& relativePath,
                         std::uintmax_t oldSize, std::uintmax_t newSize) {
    CacheNode* ancestor = &tree;
    for (size_t depth = 0; ancestor && depth < relativePath.size(); ++depth) {
        ancestor->size = ancestor->size - std::min(ancestor->size, oldSize) + newSize;
        auto it = std::find_if(ancestor->children.begin(), ancestor->children.end(),
            [&](const CacheNode& child) { return child.name == relativePath[depth]; });
        ancestor = it != ancestor->children.end() ? &*it : nullptr;
    }
}

} // namespace

const char* toString(DeletionStatus status) {
    switch (status) {
        case DeletionStatus::Deleted:        return "deleted";
        case DeletionStatus::NotLeaf:        return "not a leaf";
        case DeletionStatus::AlreadyDeleted: return "already deleted";
        case DeletionStatus::Protected:      return "protected";
        case DeletionStatus::UnknownNode:    return "unknown node";
        case DeletionStatus::IoError:        return "I/O error";
    }
    return "unknown";
}

DeletionPolicy::DeletionPolicy(std::filesystem::path cacheRoot)
    : m_cacheRoot(std::move(cacheRoot)) {}

DeletionOutcome DeletionPolicy::remove(CacheNode& tree, const std::string& nodeId) const {
    DeletionOutcome outcome;
    outcome.nodeId = nodeId;

    CacheNode* node = findNode(tree, nodeId);
    if (!node) {
        outcome.status = DeletionStatus::UnknownNode;
        outcome.message = "No cache folder named '" + nodeId + "'";
        return outcome;
    }

    if (node->isRoot()) {
        outcome.status = DeletionStatus::NotLeaf;
        outcome.message = "The cache root itself cannot be deleted";
        return outcome;
    }

    std::filesystem::path target = node->absolutePath(m_cacheRoot);

    if (!node->children.empty() || TreeBuilder::hasSubdirectories(target)) {
        outcome.status = DeletionStatus::NotLeaf;
        outcome.message = "Subdirectory Found. This is Discouraged. Aborting job. (" + nodeId + ")";
        WARN_LOG("Refusing to delete " << target.string() << ": has subdirectories");
        return outcome;
    }

    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        adjustAncestorSizes(tree, node->relativePath, node->size, 0);
        eraseNode(tree, nodeId);
        outcome.status = DeletionStatus::AlreadyDeleted;
        outcome.message = nodeId + " was already removed from disk";
        WARN_LOG("Cache folder vanished before deletion: " << target.string());
        return outcome;
    }

    if (MetadataStore::readProtection(target)) {
        outcome.status = DeletionStatus::Protected;
        outcome.message = nodeId + " is protected";
        WARN_LOG("Refusing to delete protected cache " << target.string());
        return outcome;
    }

    std::filesystem::remove_all(target, ec);
    if (ec) {
        // Some files may already be gone; report what is left
        std::uintmax_t remaining = SizeAggregator::directorySize(target);
        adjustAncestorSizes(tree, node->relativePath, node->size, remaining);
        node->size = remaining;

        outcome.status = DeletionStatus::IoError;
        outcome.message = "Failed to delete " + nodeId + " (removal may be partial): " + ec.message();
        WARN_LOG("remove_all failed for " << target.string() << ", " << remaining
                 << " bytes left: " << ec.message());
        return outcome;
    }

    adjustAncestorSizes(tree, node->relativePath, node->size, 0);
    eraseNode(tree, nodeId);
    outcome.status = DeletionStatus::Deleted;
    outcome.message = "Deleted " + nodeId;
    DEBUG_LOG("Deleted cache folder " << target.string());
    return outcome;
}

std::vector<DeletionOutcome> DeletionPolicy::removeAll(CacheNode& tree, const std::vector<std::string>& nodeIds) const {
    std::vector<DeletionOutcome> outcomes;
    outcomes.reserve(nodeIds.size());
    for (const auto& id : nodeIds) {
        outcomes.push_back(remove(tree, id));
    }
    return outcomes;
}

} // namespace FxCacheManager
