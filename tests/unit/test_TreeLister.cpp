#include "StoreFixture.hpp"
#include "fs/Filesystem.hpp"
#include "fs/errors.hpp"
#include "fs/model/Listing.hpp"

#include <algorithm>

using namespace tfs;
using namespace tfs::fs;
using namespace tfs::fs::model;

class TreeListerTest : public test::StoreFixture {};

TEST_F(TreeListerTest, BuildsFullPaths) {
    const std::vector<std::string> paths{"/top.txt", "/docs/readme.txt", "/docs/a/b/deep.txt"};
    for (const auto& p : paths) Filesystem::save(std::nullopt, p, "alice", bytes(p));

    const auto listing = Filesystem::listAll();
    ASSERT_EQ(listing.files.size(), 3u);

    std::vector<std::string> built;
    for (const auto& [id, file] : listing.files) built.push_back(listing.buildPath(file));
    std::ranges::sort(built);

    auto expected = paths;
    std::ranges::sort(expected);
    EXPECT_EQ(built, expected);
}

TEST_F(TreeListerTest, LinksChildrenSortedByName) {
    Filesystem::save(std::nullopt, "/b/f", "alice", bytes("1"));
    Filesystem::save(std::nullopt, "/a/f", "alice", bytes("2"));
    Filesystem::save(std::nullopt, "/z.txt", "alice", bytes("3"));
    Filesystem::save(std::nullopt, "/m.txt", "alice", bytes("4"));

    const auto listing = Filesystem::listAll();
    const auto& folders = listing.childrenOf(ROOT_ID);
    ASSERT_EQ(folders.size(), 2u);
    EXPECT_EQ(listing.folders.at(folders[0]).name, "a");
    EXPECT_EQ(listing.folders.at(folders[1]).name, "b");

    const auto& files = listing.filesOf(ROOT_ID);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(listing.files.at(files[0]).name, "m.txt");
    EXPECT_EQ(listing.files.at(files[1]).name, "z.txt");

    EXPECT_EQ(listing.folderPath(folders[1]), "/b");
    EXPECT_TRUE(listing.childrenOf(folders[0]).empty());
}

TEST_F(TreeListerTest, RootIsNobodysChild) {
    const auto listing = Filesystem::listAll();
    EXPECT_EQ(listing.folders.size(), 1u);
    EXPECT_TRUE(listing.childrenOf(ROOT_ID).empty());
    EXPECT_EQ(listing.folderPath(ROOT_ID), "/");
}

TEST_F(TreeListerTest, ListingReportsFrozenState) {
    const auto saved = Filesystem::save(std::nullopt, "/f", "alice", bytes("1"));
    Filesystem::checkpoint(saved.file_id, "", "v1", "alice");
    EXPECT_TRUE(Filesystem::listAll().files.at(saved.file_id).frozen);
}

TEST(ListingTest, OrphanStopsTheWalk) {
    Listing listing;
    listing.folders.emplace(ROOT_ID, Folder::root());
    listing.folders.emplace("child", Folder{"child", "gone", "child"});
    listing.files.emplace("f", File{"f", "child", "file.txt", "v", false});
    listing.link();

    EXPECT_EQ(listing.buildPath(listing.files.at("f")), "/child/file.txt");
}

TEST(ListingTest, ParentCycleIsCorruption) {
    Listing listing;
    listing.folders.emplace(ROOT_ID, Folder::root());
    listing.folders.emplace("a", Folder{"a", "b", "a"});
    listing.folders.emplace("b", Folder{"b", "a", "b"});
    listing.files.emplace("f", File{"f", "a", "file.txt", "v", false});
    listing.link();

    EXPECT_THROW((void)listing.buildPath(listing.files.at("f")), DataCorruptionError);
}
