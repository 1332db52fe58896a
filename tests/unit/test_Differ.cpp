#include <gtest/gtest.h>
#include "sync/Differ.hpp"
#include "sync/Errors.hpp"
#include "crypto/util/hash.hpp"

#include <algorithm>
#include <random>

using namespace cs::sync;
using namespace cs::sync::model;
using cs::crypto::hash::blake2b;

namespace {

ClientFileState localFile(const std::string& path, const std::string& content) {
    return { .filePath = path, .kind = EntryKind::File, .content = content, .lastKnownHash = std::nullopt };
}

ClientFileState localFolder(const std::string& path) {
    return { .filePath = path, .kind = EntryKind::Folder, .content = {}, .lastKnownHash = std::nullopt };
}

ManifestEntry committedFile(const std::string& path, const std::string& content) {
    ManifestEntry e;
    e.filePath = path;
    e.fileId = "id" + path;
    e.kind = EntryKind::File;
    e.storageKey = "key" + path;
    e.contentHash = blake2b(content);
    e.size = content.size();
    return e;
}

ManifestEntry committedFolder(const std::string& path) {
    ManifestEntry e;
    e.filePath = path;
    e.fileId = "id" + path;
    e.kind = EntryKind::Folder;
    return e;
}

}

TEST(DifferTest, IdenticalTreesProduceNoChanges) {
    const std::vector local = {localFolder("/src"), localFile("/src/a.py", "print(1)")};
    const std::vector manifest = {committedFolder("/src"), committedFile("/src/a.py", "print(1)")};
    EXPECT_TRUE(Differ::diff(local, manifest).empty());
}

TEST(DifferTest, ClassifiesNewModifiedDeleted) {
    const std::vector local = {localFile("/a.py", "v2"), localFile("/b.py", "new"), localFolder("/pkg")};
    const std::vector manifest = {committedFile("/a.py", "v1"), committedFile("/c.py", "gone")};

    const auto changes = Differ::diff(local, manifest);
    ASSERT_EQ(changes.size(), 4u);

    EXPECT_EQ(changes[0].filePath, "/a.py");
    EXPECT_EQ(changes[0].action, ChangeAction::Modified);
    EXPECT_EQ(changes[0].clientHash, blake2b("v2"));

    EXPECT_EQ(changes[1].filePath, "/b.py");
    EXPECT_EQ(changes[1].action, ChangeAction::New);
    EXPECT_EQ(changes[1].clientHash, blake2b("new"));

    EXPECT_EQ(changes[2].filePath, "/c.py");
    EXPECT_EQ(changes[2].action, ChangeAction::Deleted);
    EXPECT_EQ(changes[2].kind, EntryKind::File);
    EXPECT_FALSE(changes[2].clientHash);

    EXPECT_EQ(changes[3].filePath, "/pkg");
    EXPECT_EQ(changes[3].action, ChangeAction::New);
    EXPECT_EQ(changes[3].kind, EntryKind::Folder);
    EXPECT_FALSE(changes[3].clientHash);
}

TEST(DifferTest, FoldersAreNeverModified) {
    const std::vector local = {localFolder("/pkg")};
    const std::vector manifest = {committedFolder("/pkg")};
    EXPECT_TRUE(Differ::diff(local, manifest).empty());
}

TEST(DifferTest, DeletedFolderInheritsKind) {
    const auto changes = Differ::diff({}, {committedFolder("/old")});
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].kind, EntryKind::Folder);
    EXPECT_EQ(changes[0].action, ChangeAction::Deleted);
}

TEST(DifferTest, KindChangeBecomesDeleteThenNew) {
    const std::vector local = {localFolder("/thing")};
    const std::vector manifest = {committedFile("/thing", "x")};

    const auto changes = Differ::diff(local, manifest);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].action, ChangeAction::Deleted);
    EXPECT_EQ(changes[0].kind, EntryKind::File);
    EXPECT_EQ(changes[1].action, ChangeAction::New);
    EXPECT_EQ(changes[1].kind, EntryKind::Folder);
}

TEST(DifferTest, ResultIsIndependentOfInputOrder) {
    std::vector local = {
        localFile("/a.py", "1"), localFile("/b.py", "2"), localFolder("/d"),
        localFile("/d/e.py", "3"), localFile("/f.txt", "changed"), localFolder("/g")
    };
    std::vector manifest = {
        committedFile("/a.py", "1"), committedFile("/f.txt", "orig"), committedFile("/x.py", "x"),
        committedFolder("/old"), committedFile("/g", "was a file")
    };

    const auto expected = Differ::diff(local, manifest);

    std::mt19937 rng(42);
    for (int i = 0; i < 20; ++i) {
        std::shuffle(local.begin(), local.end(), rng);
        std::shuffle(manifest.begin(), manifest.end(), rng);
        EXPECT_EQ(Differ::diff(local, manifest), expected);
    }
}

TEST(DifferTest, DuplicateClientPathIsRejected) {
    const std::vector local = {localFile("/a.py", "1"), localFile("/a.py", "2")};
    EXPECT_THROW(Differ::diff(local, {}), ValidationError);
}

TEST(DifferTest, InvalidClientPathIsRejected) {
    EXPECT_THROW(Differ::diff({localFile("a.py", "1")}, {}), ValidationError);
    EXPECT_THROW(Differ::diff({localFile("/a/../b.py", "1")}, {}), ValidationError);
}

TEST(DifferTest, HashIsStableBlake2b256Hex) {
    const auto h = blake2b("hello");
    EXPECT_EQ(h.size(), 64u);
    EXPECT_EQ(h, blake2b("hello"));
    EXPECT_NE(h, blake2b("hello "));
}
