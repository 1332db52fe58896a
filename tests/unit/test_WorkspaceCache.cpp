#include <gtest/gtest.h>
#include "SyncHarness.hpp"
#include "sync/client/LocalTree.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>
#include <fstream>

using namespace cs;
using namespace cs::test;
using namespace cs::sync;
using namespace cs::sync::client;
using namespace cs::sync::model;
namespace fs = std::filesystem;

TEST(WorkspaceCacheTest, StartsStaleAndLoadsManifest) {
    WorkspaceCache cache("w1");
    EXPECT_TRUE(cache.stale());

    ManifestResponse m;
    m.workspaceVersion = 4;
    ManifestItem item;
    item.entry.filePath = "/a.py";
    item.entry.fileId = "f1";
    m.manifest.push_back(item);

    cache.load(m);
    EXPECT_FALSE(cache.stale());
    EXPECT_EQ(cache.version(), 4u);
    EXPECT_TRUE(cache.find("/a.py"));
    EXPECT_FALSE(cache.find("/b.py"));
}

TEST(WorkspaceCacheTest, AppliesDeletesBeforeUpserts) {
    WorkspaceCache cache("w1");
    ManifestResponse m;
    m.workspaceVersion = 1;
    ManifestItem item;
    item.entry.filePath = "/thing";
    item.entry.fileId = "old";
    m.manifest.push_back(item);
    cache.load(m);

    const std::vector<FinalizedAction> actions = {
        {.filePath = "/thing", .fileId = "new", .storageKey = "", .op = ConfirmOp::Upsert, .kind = EntryKind::Folder,
         .clientHash = std::nullopt, .size = std::nullopt},
        {.filePath = "/thing", .fileId = "old", .storageKey = "k", .op = ConfirmOp::Delete, .kind = EntryKind::File,
         .clientHash = std::nullopt, .size = std::nullopt},
    };
    cache.applyCommitted(2, actions);

    EXPECT_EQ(cache.version(), 2u);
    ASSERT_TRUE(cache.find("/thing"));
    EXPECT_EQ(cache.find("/thing")->fileId, "new");
    EXPECT_EQ(cache.find("/thing")->kind, EntryKind::Folder);
}

class LocalTreeTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() /
        ("cosync-tree-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
         ::testing::UnitTest::GetInstance()->current_test_info()->name());

    void SetUp() override { fs::create_directories(root); }
    void TearDown() override { fs::remove_all(root); }

    void write(const std::string& rel, const std::string& content) const {
        fs::create_directories((root / rel).parent_path());
        std::ofstream(root / rel, std::ios::binary) << content;
    }
};

TEST_F(LocalTreeTest, ScanSkipsHiddenEntries) {
    write("main.py", "print(1)");
    write("pkg/util.py", "x");
    write(".git/config", "ignored");
    write(".env", "SECRET=1");

    auto files = LocalTree::scan(root);
    std::ranges::sort(files, {}, &ClientFileState::filePath);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filePath, "/main.py");
    EXPECT_EQ(files[0].content, "print(1)");
    EXPECT_EQ(files[1].filePath, "/pkg");
    EXPECT_EQ(files[1].kind, EntryKind::Folder);
    EXPECT_EQ(files[2].filePath, "/pkg/util.py");
}

TEST_F(LocalTreeTest, ScanThenPullReproducesTree) {
    write("main.py", "print(1)");
    write("pkg/util.py", "x = 2");

    SyncHarness h;
    const auto ws = h.workspace("alice");
    auto c = h.client("alice", ws);
    ASSERT_TRUE(c.save(LocalTree::scan(root)).committed());

    const auto other = root / "checkout";
    const auto written = LocalTree::materialize(other, h.workspaces->manifest(ws, "alice"), *h.blobs);

    EXPECT_EQ(written, 2u);
    std::ifstream in(other / "pkg" / "util.py");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "x = 2");
}

TEST_F(LocalTreeTest, PullRejectsCorruptContent) {
    SyncHarness h;
    const auto ws = h.workspace("alice");
    auto c = h.client("alice", ws);
    ASSERT_TRUE(c.save({file("/a.py", "good")}).committed());

    auto manifest = h.workspaces->manifest(ws, "alice");
    manifest.manifest[0].entry.contentHash = crypto::hash::blake2b("other");

    EXPECT_THROW(LocalTree::materialize(root, manifest, *h.blobs), SyncError);
}
