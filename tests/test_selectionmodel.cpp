/**
 * @file test_selectionmodel.cpp
 * @brief Unit tests for SelectionModel
 *
 * @see SelectionModel
 */

#include <gtest/gtest.h>
#include "selectionmodel.hpp"

namespace {

DiskEntry entry(std::uint64_t inode, EntryKind kind, std::uint64_t bytes,
                std::uint64_t links = 1) {
    DiskEntry e;
    e.identity = {1, inode};
    e.kind = kind;
    e.size = bytes;
    e.diskUsage = bytes;
    e.linkCount = links;
    return e;
}

} // namespace

/**
 * @class SelectionModelTest
 * @brief Small synthetic scan
 *
 * Layout:
 * - /r/a/x    inode 10, 100 bytes, linked as /r/b/x2
 * - /r/a/y    inode 11, 50 bytes
 * - /r/a/lnk  symlink
 * - /r/b/x2   inode 10
 * - /r/b/deep/z inode 12, 7 bytes
 */
class SelectionModelTest : public ::testing::Test {
protected:
    ScanResult scan;
    NodeHandle root = kInvalidNode;
    NodeHandle a = kInvalidNode;
    NodeHandle b = kInvalidNode;
    NodeHandle deep = kInvalidNode;
    NodeHandle x = kInvalidNode;
    NodeHandle x2 = kInvalidNode;
    NodeHandle lnk = kInvalidNode;

    void SetUp() override {
        scan.rootPath = "/r";
        root = scan.tree.addRoot("/r", entry(1, EntryKind::Directory, 0));
        a = scan.tree.addChild(root, "a", entry(2, EntryKind::Directory, 0));
        b = scan.tree.addChild(root, "b", entry(3, EntryKind::Directory, 0));
        x = scan.tree.addChild(a, "x", entry(10, EntryKind::File, 100, 2));
        scan.tree.addChild(a, "y", entry(11, EntryKind::File, 50));
        lnk = scan.tree.addChild(a, "lnk", entry(13, EntryKind::Symlink, 9));
        x2 = scan.tree.addChild(b, "x2", entry(10, EntryKind::File, 100, 2));
        deep = scan.tree.addChild(b, "deep", entry(4, EntryKind::Directory, 0));
        scan.tree.addChild(deep, "z", entry(12, EntryKind::File, 7));
        scan.registry.observeTree(scan.tree, root);
    }
};

/**
 * @test ToggleAndSelection
 * @brief Marks are explicit, selection is inherited from marked ancestors
 */
TEST_F(SelectionModelTest, ToggleAndSelection) {
    SelectionModel selection(scan);
    EXPECT_TRUE(selection.empty());

    EXPECT_TRUE(selection.toggle(b));
    EXPECT_TRUE(selection.isMarked(b));
    EXPECT_FALSE(selection.isMarked(deep));
    EXPECT_TRUE(selection.isSelected(deep));
    EXPECT_FALSE(selection.isSelected(a));

    EXPECT_FALSE(selection.toggle(b));
    EXPECT_TRUE(selection.empty());
    EXPECT_FALSE(selection.mark(4242));
}

/**
 * @test DirectoryExpandsToRegularFiles
 * @brief A marked directory targets exactly the regular files below it
 *
 * Symlinks are not purge targets; links of the same file collapse to one
 * identity.
 */
TEST_F(SelectionModelTest, DirectoryExpandsToRegularFiles) {
    SelectionModel selection(scan);
    selection.mark(a);

    auto identities = selection.targetIdentities();
    ASSERT_EQ(identities.size(), 2u);
    EXPECT_EQ(identities[0], (FileIdentity{1, 10}));
    EXPECT_EQ(identities[1], (FileIdentity{1, 11}));

    auto agg = selection.aggregate();
    EXPECT_EQ(agg.fileCount, 2u);
    EXPECT_EQ(agg.identityCount, 2u);
    EXPECT_EQ(agg.totalBytes, 150u);
}

/**
 * @test OverlappingMarksCountOnce
 * @brief A file reached by several marks and links is one target
 */
TEST_F(SelectionModelTest, OverlappingMarksCountOnce) {
    SelectionModel selection(scan);
    selection.mark(root);
    selection.mark(b);
    selection.mark(x2);

    auto agg = selection.aggregate();
    EXPECT_EQ(agg.fileCount, 4u);
    EXPECT_EQ(agg.identityCount, 3u);
    EXPECT_EQ(agg.totalBytes, 157u);

    auto targets = selection.purgeTargets();
    ASSERT_EQ(targets.size(), 3u);
    EXPECT_EQ(targets[0].diskUsage, 100u);
}

/**
 * @test SymlinkOnlySelection
 * @brief A selection without regular files yields no targets
 */
TEST_F(SelectionModelTest, SymlinkOnlySelection) {
    SelectionModel selection(scan);
    selection.mark(lnk);

    EXPECT_FALSE(selection.empty());
    EXPECT_TRUE(selection.purgeTargets().empty());
    EXPECT_EQ(selection.aggregate().totalBytes, 0u);
}
