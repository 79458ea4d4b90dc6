#include "StoreFixture.hpp"
#include "fs/Filesystem.hpp"
#include "fs/errors.hpp"

using namespace tfs;
using namespace tfs::db;
using namespace tfs::fs;

class TreeOpsTest : public test::StoreFixture {};

TEST_F(TreeOpsTest, MoveFileChangesAddressOnly) {
    const auto saved = Filesystem::save(std::nullopt, "/a/x", "alice", bytes("payload"));
    Filesystem::moveFile(saved.file_id, "/a/x", "/b/y");

    EXPECT_FALSE(Filesystem::locateFileByPath("/a/x").has_value());
    const auto moved = Filesystem::locateFileByPath("/b/y");
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved->id, saved.file_id);
    EXPECT_EQ(moved->version_id, saved.version_id);
    EXPECT_EQ(Filesystem::read(saved.file_id), bytes("payload"));
}

TEST_F(TreeOpsTest, MoveFileFallsBackToOldPath) {
    const auto saved = Filesystem::save(std::nullopt, "/a/x", "alice", bytes("p"));
    Filesystem::moveFile(std::string("stale-id"), "/a/x", "/a/renamed");
    EXPECT_EQ(Filesystem::locateFileByPath("/a/renamed")->id, saved.file_id);
}

TEST_F(TreeOpsTest, MoveMissingFileIsNotFound) {
    EXPECT_THROW(Filesystem::moveFile(std::nullopt, "/nope", "/b/y"), NotFoundError);
}

TEST_F(TreeOpsTest, MoveFileOntoExistingNameFails) {
    const auto x = Filesystem::save(std::nullopt, "/x", "alice", bytes("x"));
    Filesystem::save(std::nullopt, "/y", "alice", bytes("y"));
    EXPECT_THROW(Filesystem::moveFile(x.file_id, "/x", "/y"), AlreadyExistsError);
    EXPECT_EQ(Filesystem::read(x.file_id), bytes("x"));
}

TEST_F(TreeOpsTest, MoveFolderCarriesDescendants) {
    const auto deep = Filesystem::save(std::nullopt, "/src/sub/deep.txt", "alice", bytes("d"));
    const auto folder = Filesystem::locateFolder("/src");
    ASSERT_TRUE(folder.has_value());

    Filesystem::moveFolder("/src", "/dst/renamed");

    EXPECT_FALSE(Filesystem::locateFolder("/src").has_value());
    EXPECT_EQ(Filesystem::locateFolder("/dst/renamed")->id, folder->id);
    EXPECT_EQ(Filesystem::locateFileByPath("/dst/renamed/sub/deep.txt")->id, deep.file_id);
}

TEST_F(TreeOpsTest, MoveFolderRejectsRootAndSelfNesting) {
    Filesystem::save(std::nullopt, "/a/f", "alice", bytes("f"));
    EXPECT_THROW(Filesystem::moveFolder("/", "/x"), std::invalid_argument);
    EXPECT_THROW(Filesystem::moveFolder("/a", "/a/b"), std::invalid_argument);
    EXPECT_FALSE(Filesystem::locateFolder("/a/b").has_value());
}

TEST_F(TreeOpsTest, MoveFolderOntoItselfIsNoop) {
    const auto f = Filesystem::save(std::nullopt, "/a/f", "alice", bytes("f"));
    const auto folder = Filesystem::locateFolder("/a");
    ASSERT_TRUE(folder.has_value());

    EXPECT_NO_THROW(Filesystem::moveFolder("/a", "/a"));
    EXPECT_EQ(Filesystem::locateFolder("/a")->id, folder->id);
    EXPECT_EQ(Filesystem::locateFileByPath("/a/f")->id, f.file_id);
    EXPECT_THROW(Filesystem::moveFolder("/nope", "/nope"), NotFoundError);
}

TEST_F(TreeOpsTest, MoveFolderToSiblingWithSharedPrefix) {
    Filesystem::save(std::nullopt, "/a/f", "alice", bytes("f"));
    Filesystem::moveFolder("/a", "/ab");
    EXPECT_TRUE(Filesystem::locateFileByPath("/ab/f").has_value());
}

TEST_F(TreeOpsTest, MoveFolderOntoExistingNameFails) {
    Filesystem::save(std::nullopt, "/a/f", "alice", bytes("f"));
    Filesystem::save(std::nullopt, "/b/g", "alice", bytes("g"));
    EXPECT_THROW(Filesystem::moveFolder("/a", "/b"), AlreadyExistsError);
}

TEST_F(TreeOpsTest, MoveMissingFolderIsNotFound) {
    EXPECT_THROW(Filesystem::moveFolder("/nope", "/x"), NotFoundError);
}

TEST_F(TreeOpsTest, RemoveFileDropsVersionsAndChunks) {
    const auto saved = Filesystem::save(std::nullopt, "/f.bin", "alice", pattern(10 * 1024));
    Filesystem::checkpoint(saved.file_id, "", "v1", "alice");
    Filesystem::checkpoint(saved.file_id, "", "v2", "alice");
    Filesystem::save(saved.file_id, "", "alice", pattern(5 * 1024));

    EXPECT_TRUE(Filesystem::removeFile(saved.file_id, std::string("/f.bin")));
    EXPECT_FALSE(Filesystem::locateFile(saved.file_id).has_value());
    EXPECT_EQ(store->totalChunks(), 0u);
    EXPECT_EQ(store->totalVersions(), 0u);
}

TEST_F(TreeOpsTest, RemoveFileByPathOnly) {
    const auto saved = Filesystem::save(std::nullopt, "/d/f", "alice", bytes("f"));
    EXPECT_TRUE(Filesystem::removeFile(std::nullopt, std::string("/d/f")));
    EXPECT_FALSE(Filesystem::locateFile(saved.file_id).has_value());
}

TEST_F(TreeOpsTest, RemoveFileWithStaleIdLeavesPathOccupantAlone) {
    const auto other = Filesystem::save(std::nullopt, "/docs/a.txt", "alice", bytes("a"));

    EXPECT_THROW(Filesystem::removeFile(std::string("stale-id"), std::string("/docs/a.txt")), NotFoundError);
    EXPECT_FALSE(Filesystem::removeFile(std::string("stale-id")));

    EXPECT_TRUE(Filesystem::locateFile(other.file_id).has_value());
    EXPECT_EQ(Filesystem::read(other.file_id), bytes("a"));
}

TEST_F(TreeOpsTest, RemoveMissingFile) {
    EXPECT_FALSE(Filesystem::removeFile(std::string("missing")));
    EXPECT_THROW(Filesystem::removeFile(std::string("missing"), std::string("/missing")), NotFoundError);
}

TEST_F(TreeOpsTest, RemoveFolderIsRecursive) {
    const auto keep = Filesystem::save(std::nullopt, "/keep/k", "alice", bytes("k"));
    std::vector<std::string> doomed;
    for (const auto* path : {"/a/1", "/a/b/2", "/a/b/c/3", "/a/d/4"})
        doomed.push_back(Filesystem::save(std::nullopt, path, "alice", pattern(5000)).file_id);

    Filesystem::removeFolder("/a");

    for (const auto& id : doomed) EXPECT_FALSE(Filesystem::locateFile(id).has_value());
    EXPECT_FALSE(Filesystem::locateFolder("/a").has_value());

    const auto listing = Filesystem::listAll();
    EXPECT_EQ(listing.folders.size(), 2u);
    EXPECT_EQ(listing.files.size(), 1u);
    EXPECT_TRUE(listing.files.contains(keep.file_id));
    EXPECT_EQ(store->totalChunks(), 1u);
}

TEST_F(TreeOpsTest, RemoveRootEmptiesTreeButKeepsRoot) {
    Filesystem::save(std::nullopt, "/a/1", "alice", bytes("1"));
    Filesystem::save(std::nullopt, "/2", "alice", bytes("2"));

    Filesystem::removeFolder("/");

    const auto listing = Filesystem::listAll();
    ASSERT_EQ(listing.folders.size(), 1u);
    EXPECT_TRUE(listing.folders.begin()->second.isRoot());
    EXPECT_TRUE(listing.files.empty());
}

TEST_F(TreeOpsTest, BatchedFolderDeleteSkipsRoot) {
    Filesystem::save(std::nullopt, "/a/1", "alice", bytes("1"));
    Filesystem::save(std::nullopt, "/b/2", "alice", bytes("2"));
    const auto a = Filesystem::locateFolder("/a");
    const auto b = Filesystem::locateFolder("/b");
    ASSERT_TRUE(a.has_value() && b.has_value());

    const auto before = store->commits();
    Transactions::exec("test", [&](Txn& txn) { txn.deleteFolders({model::ROOT_ID, a->id, b->id}); });

    EXPECT_EQ(store->commits(), before + 1);
    EXPECT_EQ(store->totalFolders(), 1u);
    EXPECT_TRUE(Filesystem::locateFolder("/").has_value());
}

TEST_F(TreeOpsTest, RemoveMissingFolderIsNotFound) {
    EXPECT_THROW(Filesystem::removeFolder("/nope"), NotFoundError);
}

TEST_F(TreeOpsTest, RemoveFolderCanBeRerun) {
    Filesystem::save(std::nullopt, "/a/b/1", "alice", bytes("1"));
    const auto two = Filesystem::save(std::nullopt, "/a/2", "alice", bytes("2"));

    // a delete that stopped after one file
    Filesystem::removeFile(two.file_id);
    Filesystem::removeFolder("/a");

    EXPECT_EQ(Filesystem::listAll().folders.size(), 1u);
}
