#include "tree_builder.hpp"
#include "debug.hpp"
#include "metadata_store.hpp"
#include "size_aggregator.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace FxCacheManager {

namespace {

// Bytes of the regular files directly inside a directory (no recursion)
std::uintmax_t directFileBytes(const std::filesystem::path& directory) {
    std::error_code ec;
    std::uintmax_t total = 0;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return 0;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entryEc;
        if (it->is_regular_file(entryEc)) {
            auto fileSize = it->file_size(entryEc);
            if (!entryEc) {
                total += fileSize;
            }
        }
    }
    return total;
}

void annotateLeaf(CacheNode& node, const std::filesystem::path& directory) {
    CacheMetadata metadata = MetadataStore::read(directory);
    node.comment = std::move(metadata.comment);
    node.isProtected = metadata.isProtected;
    node.size = SizeAggregator::directorySize(directory);
}

} // namespace

TreeBuilder::TreeBuilder(unsigned workerCount)
    : m_workerCount(workerCount) {
    if (m_workerCount == 0) {
        m_workerCount = std::max(1u, std::thread::hardware_concurrency());
    }
}

bool TreeBuilder::hasSubdirectories(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return false;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return false;
        }
        std::error_code entryEc;
        if (it->is_directory(entryEc)) {
            return true;
        }
    }
    return false;
}

std::vector<CacheNode> TreeBuilder::listChildren(const CacheNode& parent, const std::filesystem::path& directory) const {
    std::vector<CacheNode> children;

    std::error_code ec;
    auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::directory_iterator it(directory, options, ec);
    if (ec) {
        // Deleted out from under us; treat as an empty listing
        DEBUG_LOG("Listing failed for " << directory.string() << ": " << ec.message());
        return children;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            DEBUG_LOG("Listing interrupted for " << directory.string() << ": " << ec.message());
            break;
        }

        std::error_code entryEc;
        if (!it->is_directory(entryEc)) {
            continue;
        }

        CacheNode child;
        child.name = it->path().filename().string();
        child.relativePath = parent.relativePath;
        child.relativePath.push_back(child.name);
        child.modifiedTime = std::filesystem::last_write_time(it->path(), entryEc);
        if (entryEc) {
            // Removed between listing and stat
            DEBUG_LOG("Skipping vanished directory " << it->path().string() << ": " << entryEc.message());
            continue;
        }
        child.kind = hasSubdirectories(it->path()) ? NodeKind::Branch : NodeKind::Leaf;

        if (child.isLeaf()) {
            annotateLeaf(child, it->path());
        }

        children.push_back(std::move(child));
    }

    std::sort(children.begin(), children.end(),
        [](const CacheNode& a, const CacheNode& b) { return a.name < b.name; });
    return children;
}

void TreeBuilder::populate(CacheNode& node, const std::filesystem::path& directory, int depth) const {
    if (depth > kMaxDepth) {
        WARN_LOG("Not descending below " << directory.string() << " (depth limit " << kMaxDepth << ", symlink loop?)");
        return;
    }

    node.children = listChildren(node, directory);

    // The look-ahead and the listing can disagree if the directory changed in between
    if (node.isLeaf() && !node.children.empty()) {
        DEBUG_LOG("Reclassifying " << node.id() << " as branch (subdirectory appeared)");
        node.kind = NodeKind::Branch;
        node.comment.clear();
        node.isProtected = false;
    } else if (!node.isLeaf() && node.children.empty()) {
        DEBUG_LOG("Reclassifying " << node.id() << " as leaf (subdirectories vanished)");
        node.kind = NodeKind::Leaf;
        annotateLeaf(node, directory);
    }

    for (auto& child : node.children) {
        populate(child, directory / child.name, depth + 1);
    }

    if (!node.isLeaf()) {
        std::uintmax_t total = directFileBytes(directory);
        for (const auto& child : node.children) {
            total += child.size;
        }
        node.size = total;
    }
}

CacheNode TreeBuilder::build(const std::filesystem::path& root) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw RootNotFoundError(root);
    }

    DEBUG_LOG("TreeBuilder::build starting: " << root.string() << " workers=" << m_workerCount);
    SCOPED_TIMER("TreeBuilder::build");

    CacheNode tree;
    tree.modifiedTime = std::filesystem::last_write_time(root, ec);
    tree.children = listChildren(tree, root);
    tree.kind = tree.children.empty() ? NodeKind::Leaf : NodeKind::Branch;

    // Top-level fan-out: workers claim subtrees by index until none are left
    std::atomic<size_t> nextIndex{0};
    std::mutex errorMutex;
    std::exception_ptr firstError;
    size_t threadCount = std::min<size_t>(m_workerCount, tree.children.size());

    {
        std::vector<std::jthread> workers;
        workers.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back([&]() {
                for (size_t index = nextIndex++; index < tree.children.size(); index = nextIndex++) {
                    CacheNode& child = tree.children[index];
                    try {
                        populate(child, root / child.name, 1);
                    } catch (...) {
                        std::lock_guard<std::mutex> lock(errorMutex);
                        if (!firstError) {
                            firstError = std::current_exception();
                        }
                    }
                }
            });
        }
    } // jthreads join here

    if (firstError) {
        std::rethrow_exception(firstError);
    }

    std::uintmax_t total = directFileBytes(root);
    for (const auto& child : tree.children) {
        total += child.size;
    }
    tree.size = total;

    DEBUG_LOG("TreeBuilder::build found " << countNodes(tree) << " directories under " << root.string());
    return tree;
}

} // namespace FxCacheManager
