#include <gtest/gtest.h>
#include <tree_builder.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;
using namespace FxCacheManager;

class TreeBuilderTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("fxcache_tree_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void make_dir(const std::string& rel_path) {
        fs::create_directories(test_dir / rel_path);
    }

    void write_bytes(const std::string& rel_path, std::size_t count) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << std::string(count, 'x');
    }

    // shot010/smoke/{v001,v002}, shot010/notes.txt, shot020/v001, top.txt
    void make_show_layout() {
        write_bytes("shot010/smoke/v001/smoke.0001.vdb", 100);
        write_bytes("shot010/smoke/v002/smoke.0001.vdb", 50);
        write_bytes("shot010/notes.txt", 10);
        make_dir("shot020/v001");
        write_bytes("top.txt", 5);
    }

    static void flatten(const CacheNode& node, std::vector<std::tuple<std::string, NodeKind, std::uintmax_t>>& out) {
        for (const auto& child : node.children) {
            out.emplace_back(child.id(), child.kind, child.size);
            flatten(child, out);
        }
    }
};

TEST_F(TreeBuilderTest, MissingRootThrows) {
    TreeBuilder builder(2);
    EXPECT_THROW(builder.build(test_dir / "nope"), RootNotFoundError);
}

TEST_F(TreeBuilderTest, FileAsRootThrows) {
    write_bytes("plain.txt", 3);
    TreeBuilder builder(2);
    try {
        builder.build(test_dir / "plain.txt");
        FAIL() << "expected RootNotFoundError";
    } catch (const RootNotFoundError& e) {
        EXPECT_EQ(e.root(), test_dir / "plain.txt");
    }
}

TEST_F(TreeBuilderTest, EmptyRootHasNoChildren) {
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);
    EXPECT_TRUE(tree.isRoot());
    EXPECT_TRUE(tree.children.empty());
    EXPECT_EQ(tree.size, 0u);
}

TEST_F(TreeBuilderTest, ClassifiesBranchesAndLeaves) {
    make_show_layout();
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    ASSERT_EQ(tree.children.size(), 2u);
    EXPECT_EQ(tree.children[0].name, "shot010");
    EXPECT_EQ(tree.children[1].name, "shot020");

    const CacheNode* shot010 = findNode(tree, "shot010");
    const CacheNode* smoke = findNode(tree, "shot010/smoke");
    const CacheNode* v001 = findNode(tree, "shot010/smoke/v001");
    const CacheNode* shot020v001 = findNode(tree, "shot020/v001");
    ASSERT_NE(shot010, nullptr);
    ASSERT_NE(smoke, nullptr);
    ASSERT_NE(v001, nullptr);
    ASSERT_NE(shot020v001, nullptr);

    EXPECT_EQ(shot010->kind, NodeKind::Branch);
    EXPECT_EQ(smoke->kind, NodeKind::Branch);
    EXPECT_EQ(v001->kind, NodeKind::Leaf);
    EXPECT_TRUE(v001->children.empty());
    EXPECT_EQ(shot020v001->kind, NodeKind::Leaf);

    // Plain files never become nodes
    EXPECT_EQ(findNode(tree, "top.txt"), nullptr);
    EXPECT_EQ(findNode(tree, "shot010/notes.txt"), nullptr);
}

TEST_F(TreeBuilderTest, RecordsRelativePaths) {
    make_show_layout();
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    const CacheNode* v002 = findNode(tree, "shot010/smoke/v002");
    ASSERT_NE(v002, nullptr);
    std::vector<std::string> expected{"shot010", "smoke", "v002"};
    EXPECT_EQ(v002->relativePath, expected);
    EXPECT_EQ(v002->id(), "shot010/smoke/v002");
    EXPECT_EQ(v002->absolutePath(test_dir), test_dir / "shot010" / "smoke" / "v002");
}

TEST_F(TreeBuilderTest, ChildrenSortedByName) {
    make_dir("c/v001");
    make_dir("a/v001");
    make_dir("b/v001");
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    ASSERT_EQ(tree.children.size(), 3u);
    EXPECT_EQ(tree.children[0].name, "a");
    EXPECT_EQ(tree.children[1].name, "b");
    EXPECT_EQ(tree.children[2].name, "c");
}

TEST_F(TreeBuilderTest, AggregatesSizes) {
    make_show_layout();
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    EXPECT_EQ(findNode(tree, "shot010/smoke/v001")->size, 100u);
    EXPECT_EQ(findNode(tree, "shot010/smoke/v002")->size, 50u);
    EXPECT_EQ(findNode(tree, "shot010/smoke")->size, 150u);
    EXPECT_EQ(findNode(tree, "shot010")->size, 160u);
    EXPECT_EQ(findNode(tree, "shot020/v001")->size, 0u);
    EXPECT_EQ(tree.size, 165u);
}

TEST_F(TreeBuilderTest, LeafSizeIncludesNestedFilesOnly) {
    write_bytes("fx/v001/frame.0001.bgeo", 30);
    write_bytes("fx/v001/frame.0002.bgeo", 70);
    TreeBuilder builder(1);
    CacheNode tree = builder.build(test_dir);
    EXPECT_EQ(findNode(tree, "fx/v001")->size, 100u);
}

TEST_F(TreeBuilderTest, ReadsSidecarForLeaves) {
    make_dir("shot010/v001");
    std::ofstream(test_dir / "shot010" / "v001" / "cacheinfo.json")
        << R"({"comment": "final", "cache_protect": 1})";

    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    const CacheNode* leaf = findNode(tree, "shot010/v001");
    ASSERT_NE(leaf, nullptr);
    EXPECT_EQ(leaf->comment, "final");
    EXPECT_TRUE(leaf->isProtected);
}

TEST_F(TreeBuilderTest, IgnoresSidecarOnBranches) {
    make_dir("shot010/v001");
    std::ofstream(test_dir / "shot010" / "cacheinfo.json")
        << R"({"comment": "not a version", "cache_protect": 1})";

    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    const CacheNode* branch = findNode(tree, "shot010");
    ASSERT_NE(branch, nullptr);
    EXPECT_EQ(branch->comment, "");
    EXPECT_FALSE(branch->isProtected);
}

TEST_F(TreeBuilderTest, RepeatedScansAreIdentical) {
    make_show_layout();
    TreeBuilder builder(4);

    std::vector<std::tuple<std::string, NodeKind, std::uintmax_t>> first, second;
    flatten(builder.build(test_dir), first);
    flatten(builder.build(test_dir), second);

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(TreeBuilderTest, PoolSizeDoesNotChangeResult) {
    for (int i = 0; i < 20; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "shot%03d", i * 10);
        write_bytes(std::string(name) + "/v001/data.bgeo", static_cast<std::size_t>(i + 1));
    }

    std::vector<std::tuple<std::string, NodeKind, std::uintmax_t>> single, pooled;
    flatten(TreeBuilder(1).build(test_dir), single);
    flatten(TreeBuilder(8).build(test_dir), pooled);

    EXPECT_EQ(single.size(), 40u);
    EXPECT_EQ(single, pooled);
}

TEST_F(TreeBuilderTest, ZeroWorkersUsesAtLeastOne) {
    TreeBuilder builder(0);
    EXPECT_GE(builder.workerCount(), 1u);
}

TEST_F(TreeBuilderTest, HasSubdirectories) {
    make_dir("branch/leaf");
    write_bytes("leaf_only/file.txt", 1);

    EXPECT_TRUE(TreeBuilder::hasSubdirectories(test_dir / "branch"));
    EXPECT_FALSE(TreeBuilder::hasSubdirectories(test_dir / "branch" / "leaf"));
    EXPECT_FALSE(TreeBuilder::hasSubdirectories(test_dir / "leaf_only"));
    EXPECT_FALSE(TreeBuilder::hasSubdirectories(test_dir / "missing"));
}

TEST_F(TreeBuilderTest, SymlinkLoopTerminates) {
    make_dir("fx/v001");
    std::error_code ec;
    fs::create_directory_symlink(test_dir / "fx", test_dir / "fx" / "loop", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);
    EXPECT_NE(findNode(tree, "fx/v001"), nullptr);
    EXPECT_NE(findNode(tree, "fx/loop/v001"), nullptr);
}

TEST_F(TreeBuilderTest, EveryNodeHasAModificationTime) {
    make_show_layout();
    TreeBuilder builder(2);
    CacheNode tree = builder.build(test_dir);

    std::vector<const CacheNode*> pending{&tree};
    std::size_t visited = 0;
    while (!pending.empty()) {
        const CacheNode* node = pending.back();
        pending.pop_back();
        EXPECT_NE(node->modifiedTime, fs::file_time_type::min()) << node->id();
        for (const auto& child : node->children) {
            pending.push_back(&child);
        }
        ++visited;
    }
    EXPECT_EQ(visited, countNodes(tree) + 1);
}
