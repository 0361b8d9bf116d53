#include "cache_node.hpp"
#include <algorithm>
#include <sstream>

namespace FxCacheManager {

std::string CacheNode::id() const {
    std::string result;
    for (const auto& segment : relativePath) {
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

std::filesystem::path CacheNode::absolutePath(const std::filesystem::path& cacheRoot) const {
    std::filesystem::path result = cacheRoot;
    for (const auto& segment : relativePath) {
        result /= segment;
    }
    return result;
}

std::vector<std::string> splitNodeId(const std::string& id) {
    std::vector<std::string> segments;
    std::istringstream stream(id);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

namespace {

CacheNode* findChild(CacheNode& parent, const std::string& name) {
    auto it = std::find_if(parent.children.begin(), parent.children.end(),
        [&name](const CacheNode& child) { return child.name == name; });
    return it != parent.children.end() ? &*it : nullptr;
}

void visitLeaves(CacheNode& node, const CacheNode* parent,
                 const std::function<void(CacheNode&, const CacheNode*)>& visitor) {
    // The root is the cache directory itself, never a version
    if (!node.isRoot() && node.isLeaf()) {
        visitor(node, parent);
    }
    for (auto& child : node.children) {
        visitLeaves(child, &node, visitor);
    }
}

} // namespace

CacheNode* findNode(CacheNode& root, const std::string& id) {
    CacheNode* current = &root;
    for (const auto& segment : splitNodeId(id)) {
        current = findChild(*current, segment);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

const CacheNode* findNode(const CacheNode& root, const std::string& id) {
    return findNode(const_cast<CacheNode&>(root), id);
}

bool eraseNode(CacheNode& root, const std::string& id) {
    auto segments = splitNodeId(id);
    if (segments.empty()) {
        return false;
    }

    CacheNode* parent = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        parent = findChild(*parent, segments[i]);
        if (!parent) {
            return false;
        }
    }

    auto it = std::find_if(parent->children.begin(), parent->children.end(),
        [&segments](const CacheNode& child) { return child.name == segments.back(); });
    if (it == parent->children.end()) {
        return false;
    }
    parent->children.erase(it);
    return true;
}

void forEachLeaf(CacheNode& root, const std::function<void(CacheNode& leaf, const CacheNode* parent)>& visitor) {
    visitLeaves(root, nullptr, visitor);
}

std::size_t countNodes(const CacheNode& root) {
    std::size_t count = 0;
    for (const auto& child : root.children) {
        count += 1 + countNodes(child);
    }
    return count;
}

} // namespace FxCacheManager
