#include "version_matcher.hpp"
#include "debug.hpp"
#include <algorithm>
#include <cctype>

namespace FxCacheManager {

std::optional<std::string> VersionMatcher::normalizeVersion(std::string_view version) {
    if (version.empty()) {
        return std::nullopt;
    }

    bool allDigits = std::all_of(version.begin(), version.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    if (!allDigits) {
        return std::nullopt;
    }

    auto firstNonZero = version.find_first_not_of('0');
    if (firstNonZero == std::string_view::npos) {
        return std::string("0");
    }
    return std::string(version.substr(firstNonZero));
}

std::optional<std::string> VersionMatcher::parseVersionName(std::string_view name) {
    if (name.size() < 2) {
        return std::nullopt;
    }
    if (std::tolower(static_cast<unsigned char>(name.front())) != kVersionPrefix) {
        return std::nullopt;
    }
    return normalizeVersion(name.substr(1));
}

std::size_t VersionMatcher::match(CacheNode& tree, const std::vector<VersionReference>& references) {
    // Normalize once; references with unusable versions can never match
    std::vector<VersionReference> usable;
    usable.reserve(references.size());
    for (const auto& ref : references) {
        auto version = normalizeVersion(ref.version);
        if (!version) {
            DEBUG_LOG("Skipping reference " << ref.identifier << " with non-numeric version '" << ref.version << "'");
            continue;
        }
        usable.push_back({ref.identifier, *version});
    }

    std::size_t matched = 0;
    forEachLeaf(tree, [&](CacheNode& leaf, const CacheNode* parent) {
        if (!parent || parent->isRoot()) {
            return;
        }
        auto version = parseVersionName(leaf.name);
        if (!version) {
            return;
        }

        for (const auto& ref : usable) {
            if (ref.identifier == parent->name && ref.version == *version) {
                leaf.inUse = true;
                ++matched;
                break;
            }
        }
    });

    DEBUG_LOG("VersionMatcher: " << matched << " in-use versions for " << usable.size() << " references");
    return matched;
}

void VersionMatcher::clear(CacheNode& tree) {
    tree.inUse = false;
    for (auto& child : tree.children) {
        clear(child);
    }
}

} // namespace FxCacheManager
