#include <gtest/gtest.h>
#include <version_matcher.hpp>
#include <string>
#include <vector>

using namespace FxCacheManager;

namespace {

CacheNode& addChild(CacheNode& parent, const std::string& name, NodeKind kind) {
    CacheNode child;
    child.name = name;
    child.kind = kind;
    child.relativePath = parent.relativePath;
    child.relativePath.push_back(name);
    parent.children.push_back(std::move(child));
    parent.kind = NodeKind::Branch;
    return parent.children.back();
}

// shot010/{v003,v004,v3a}, shot020/v003, shot030/smoke/v012, v003 (root level)
CacheNode makeTree() {
    CacheNode root;
    CacheNode& shot010 = addChild(root, "shot010", NodeKind::Branch);
    addChild(shot010, "v003", NodeKind::Leaf);
    addChild(shot010, "v004", NodeKind::Leaf);
    addChild(shot010, "v3a", NodeKind::Leaf);
    CacheNode& shot020 = addChild(root, "shot020", NodeKind::Branch);
    addChild(shot020, "v003", NodeKind::Leaf);
    CacheNode& shot030 = addChild(root, "shot030", NodeKind::Branch);
    CacheNode& smoke = addChild(shot030, "smoke", NodeKind::Branch);
    addChild(smoke, "v012", NodeKind::Leaf);
    addChild(root, "v003", NodeKind::Leaf);
    return root;
}

bool inUse(const CacheNode& tree, const std::string& id) {
    const CacheNode* node = findNode(tree, id);
    return node && node->inUse;
}

} // namespace

TEST(VersionMatcher, ParseVersionName) {
    EXPECT_EQ(VersionMatcher::parseVersionName("v003"), "3");
    EXPECT_EQ(VersionMatcher::parseVersionName("v12"), "12");
    EXPECT_EQ(VersionMatcher::parseVersionName("V7"), "7");
    EXPECT_EQ(VersionMatcher::parseVersionName("v000"), "0");
}

TEST(VersionMatcher, ParseRejectsMalformedNames) {
    EXPECT_FALSE(VersionMatcher::parseVersionName(""));
    EXPECT_FALSE(VersionMatcher::parseVersionName("v"));
    EXPECT_FALSE(VersionMatcher::parseVersionName("003"));
    EXPECT_FALSE(VersionMatcher::parseVersionName("v1a"));
    EXPECT_FALSE(VersionMatcher::parseVersionName("take3"));
    EXPECT_FALSE(VersionMatcher::parseVersionName("v-1"));
}

TEST(VersionMatcher, NormalizeVersion) {
    EXPECT_EQ(VersionMatcher::normalizeVersion("3"), "3");
    EXPECT_EQ(VersionMatcher::normalizeVersion("003"), "3");
    EXPECT_EQ(VersionMatcher::normalizeVersion("0"), "0");
    EXPECT_FALSE(VersionMatcher::normalizeVersion(""));
    EXPECT_FALSE(VersionMatcher::normalizeVersion("1.5"));
    EXPECT_FALSE(VersionMatcher::normalizeVersion("-2"));
}

TEST(VersionMatcher, MarksOnlyTheReferencedVersion) {
    CacheNode tree = makeTree();
    std::size_t matched = VersionMatcher::match(tree, {{"shot010", "3"}});

    EXPECT_EQ(matched, 1u);
    EXPECT_TRUE(inUse(tree, "shot010/v003"));
    EXPECT_FALSE(inUse(tree, "shot010/v004"));
    EXPECT_FALSE(inUse(tree, "shot020/v003"));
    EXPECT_FALSE(inUse(tree, "shot010"));
}

TEST(VersionMatcher, ZeroPaddedReferenceVersionMatches) {
    CacheNode tree = makeTree();
    VersionMatcher::match(tree, {{"shot010", "004"}});
    EXPECT_TRUE(inUse(tree, "shot010/v004"));
}

TEST(VersionMatcher, IdentifierIsTheImmediateParent) {
    CacheNode tree = makeTree();
    EXPECT_EQ(VersionMatcher::match(tree, {{"shot030", "12"}}), 0u);
    EXPECT_EQ(VersionMatcher::match(tree, {{"smoke", "12"}}), 1u);
    EXPECT_TRUE(inUse(tree, "shot030/smoke/v012"));
}

TEST(VersionMatcher, RootLevelLeavesNeverMatch) {
    CacheNode tree = makeTree();
    EXPECT_EQ(VersionMatcher::match(tree, {{"", "3"}}), 0u);
    EXPECT_FALSE(inUse(tree, "v003"));
}

TEST(VersionMatcher, MalformedVersionDirectoriesNeverMatch) {
    CacheNode tree = makeTree();
    VersionMatcher::match(tree, {{"shot010", "3a"}, {"shot010", "3"}});
    EXPECT_FALSE(inUse(tree, "shot010/v3a"));
    EXPECT_TRUE(inUse(tree, "shot010/v003"));
}

TEST(VersionMatcher, SeveralReferences) {
    CacheNode tree = makeTree();
    std::size_t matched = VersionMatcher::match(tree, {
        {"shot010", "4"},
        {"shot020", "3"},
        {"shot099", "1"},
    });

    EXPECT_EQ(matched, 2u);
    EXPECT_TRUE(inUse(tree, "shot010/v004"));
    EXPECT_TRUE(inUse(tree, "shot020/v003"));
    EXPECT_FALSE(inUse(tree, "shot010/v003"));
}

TEST(VersionMatcher, NoReferencesMarksNothing) {
    CacheNode tree = makeTree();
    EXPECT_EQ(VersionMatcher::match(tree, {}), 0u);
    EXPECT_FALSE(inUse(tree, "shot010/v003"));
}

TEST(VersionMatcher, ClearResetsFlags) {
    CacheNode tree = makeTree();
    VersionMatcher::match(tree, {{"shot010", "3"}, {"smoke", "12"}});
    VersionMatcher::clear(tree);
    EXPECT_FALSE(inUse(tree, "shot010/v003"));
    EXPECT_FALSE(inUse(tree, "shot030/smoke/v012"));
}
