/**
 * @file test_scanpersistence.cpp
 * @brief Unit tests for saving and loading scans as JSON
 *
 * @see ScanPersistence
 */

#include "hardlinktest.hpp"
#include "filescanner.hpp"
#include "scanpersistence.hpp"

namespace {

/** @brief Smallest valid document: root dir with one file */
const char* kMinimalScan = R"({
  "schema_version": 1,
  "root_path": "/data",
  "device_id": 42,
  "xdev": false,
  "apparent_size": false,
  "generated_at": "2026-01-01T00:00:00Z",
  "tree": {
    "name": "/data", "type": "dir", "size": 4096, "disk_usage": 4096,
    "device": 42, "inode": 2, "link_count": 3,
    "cross_device": false, "unreadable": false,
    "children": [
      {"name": "file", "type": "file", "size": 10, "disk_usage": 4096,
       "device": 42, "inode": 7, "link_count": 1,
       "cross_device": false, "unreadable": false},
      {"name": "mnt", "type": "dir", "size": 4096, "disk_usage": 4096,
       "device": 43, "inode": 2, "link_count": 2,
       "cross_device": true, "unreadable": false, "children": []}
    ]
  },
  "inode_registry": {
    "42:7": {"size": 10, "disk_usage": 4096, "link_count": 1, "paths": ["/data/file"]}
  }
})";

std::string replaced(std::string text, const std::string& from, const std::string& to) {
    auto pos = text.find(from);
    if (pos != std::string::npos) {
        text.replace(pos, from.size(), to);
    }
    return text;
}

} // namespace

/**
 * @class ScanPersistenceTest
 * @brief Real scans written to and read back from the temporary directory
 */
class ScanPersistenceTest : public HardlinkTest {};

/**
 * @test RoundTripKeepsTreeAndTotals
 * @brief A saved and loaded scan has the same tree, registry and totals
 */
TEST_F(ScanPersistenceTest, RoundTripKeepsTreeAndTotals) {
    createSizedFile("root/a/file", 12000);
    createLink("root/a/file", "root/b/link");
    createSizedFile("root/b/other", 300);
    createSymlink("../a/file", "root/b/sym");
    createFile("root/name with spaces \"quoted\"", "q");

    FileScanner scanner(log);
    ScanResult original = scanner.scan(test_dir / "root", ScanOptions());

    auto file = (test_dir / "scan.json").string();
    ScanPersistence::save(original, file);
    ScanResult loaded = ScanPersistence::load(file);

    EXPECT_EQ(loaded.rootPath, original.rootPath);
    EXPECT_EQ(loaded.deviceId, original.deviceId);
    EXPECT_EQ(loaded.generatedAt, original.generatedAt);
    ASSERT_EQ(loaded.tree.size(), original.tree.size());
    for (NodeHandle h = 0; h < original.tree.size(); ++h) {
        const TreeNode& a = original.tree.node(h);
        const TreeNode& b = loaded.tree.node(h);
        EXPECT_EQ(a.name, b.name);
        EXPECT_EQ(a.parent, b.parent);
        EXPECT_EQ(a.entry.identity, b.entry.identity);
        EXPECT_EQ(a.entry.kind, b.entry.kind);
        EXPECT_EQ(a.entry.diskUsage, b.entry.diskUsage);
        EXPECT_EQ(a.aggregate, b.aggregate);
    }

    EXPECT_EQ(loaded.totalBytes(), original.totalBytes());
    ASSERT_EQ(loaded.registry.size(), original.registry.size());
    for (const InodeRecord* record : original.registry.records()) {
        const InodeRecord* other = loaded.registry.find(record->identity);
        ASSERT_NE(other, nullptr);
        EXPECT_EQ(other->paths, record->paths);
        EXPECT_EQ(other->linkCount, record->linkCount);
        EXPECT_EQ(other->owner(), record->owner());
    }
}

/**
 * @test RoundTripKeepsNonUtf8Names
 * @brief File names are raw bytes; invalid UTF-8 survives save and load
 */
TEST_F(ScanPersistenceTest, RoundTripKeepsNonUtf8Names) {
    const std::string latin1 = "caf\xe9";
    createSizedFile("root/" + latin1, 500);
    createLink("root/" + latin1, "root/bad\xff");

    FileScanner scanner(log);
    ScanResult original = scanner.scan(test_dir / "root", ScanOptions());

    auto file = (test_dir / "scan.json").string();
    ASSERT_NO_THROW(ScanPersistence::save(original, file));
    ScanResult loaded = ScanPersistence::load(file);

    EXPECT_NE(loaded.tree.findByPath((test_dir / "root" / latin1).string()), kInvalidNode);
    EXPECT_NE(loaded.tree.findByPath((test_dir / "root/bad\xff").string()), kInvalidNode);
    ASSERT_EQ(loaded.registry.size(), 1u);
    const InodeRecord* record = loaded.registry.records().front();
    EXPECT_EQ(record->paths, (std::vector<std::string>{
                                 (test_dir / "root/bad\xff").string(),
                                 (test_dir / "root" / latin1).string()}));
    EXPECT_EQ(loaded.totalBytes(), original.totalBytes());
}

/**
 * @test ParsesMinimalDocument
 * @brief Registry facts override tree facts, boundaries are counted
 */
TEST_F(ScanPersistenceTest, ParsesMinimalDocument) {
    ScanResult scan = ScanPersistence::fromJson(kMinimalScan);

    EXPECT_EQ(scan.rootPath, "/data");
    EXPECT_EQ(scan.tree.size(), 3u);
    EXPECT_EQ(scan.boundariesSkipped, 1u);
    EXPECT_EQ(scan.totalBytes(), 4096u);

    NodeHandle mnt = scan.tree.findByPath("/data/mnt");
    ASSERT_NE(mnt, kInvalidNode);
    EXPECT_TRUE(scan.tree.node(mnt).crossDevice);
}

/**
 * @test RejectsMalformedJson
 * @brief Truncated text is a SerializationError
 */
TEST_F(ScanPersistenceTest, RejectsMalformedJson) {
    std::string text(kMinimalScan);
    EXPECT_THROW(ScanPersistence::fromJson(text.substr(0, text.size() / 2)),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::fromJson("[]"), SerializationError);
}

/**
 * @test RejectsOtherSchemaVersion
 * @brief Only the current schema version is accepted
 */
TEST_F(ScanPersistenceTest, RejectsOtherSchemaVersion) {
    EXPECT_THROW(ScanPersistence::fromJson(
                     replaced(kMinimalScan, "\"schema_version\": 1", "\"schema_version\": 2")),
                 SerializationError);
}

/**
 * @test RejectsMissingAndMistypedFields
 * @brief Missing fields and wrong types name the problem
 */
TEST_F(ScanPersistenceTest, RejectsMissingAndMistypedFields) {
    EXPECT_THROW(ScanPersistence::fromJson(
                     replaced(kMinimalScan, "\"device_id\": 42,", "")),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::fromJson(
                     replaced(kMinimalScan, "\"xdev\": false", "\"xdev\": \"no\"")),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::fromJson(
                     replaced(kMinimalScan, "\"type\": \"file\"", "\"type\": \"fifo\"")),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::fromJson(
                     replaced(kMinimalScan, "\"root_path\": \"/data\"", "\"root_path\": \"/other\"")),
                 SerializationError);
}

/**
 * @test RejectsUnknownRegistryIdentity
 * @brief A registry entry without a tree node is a SerializationError
 */
TEST_F(ScanPersistenceTest, RejectsUnknownRegistryIdentity) {
    EXPECT_THROW(ScanPersistence::fromJson(replaced(kMinimalScan, "\"42:7\"", "\"42:8\"")),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::fromJson(replaced(kMinimalScan, "\"42:7\"", "\"bogus\"")),
                 SerializationError);
}

/**
 * @test LoadMissingFile
 * @brief An unreadable file is a SerializationError, not a crash
 */
TEST_F(ScanPersistenceTest, LoadMissingFile) {
    EXPECT_THROW(ScanPersistence::load((test_dir / "missing.json").string()),
                 SerializationError);
    EXPECT_THROW(ScanPersistence::save(ScanResult(), (test_dir / "empty.json").string()),
                 SerializationError);
}
