#include <gtest/gtest.h>
#include "fs/model/Path.hpp"

using namespace tfs::fs::model;

class PathTest : public ::testing::Test {};

TEST_F(PathTest, ParseDropsEmptySegments) {
    EXPECT_EQ(Path("/a//b/c/").segments, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(Path("a/b"), Path("/a/b"));
    EXPECT_TRUE(Path("").empty());
    EXPECT_TRUE(Path("///").empty());
}

TEST_F(PathTest, TruncateDropsTrailingSegments) {
    const Path p("/docs/notes/readme.txt");
    EXPECT_EQ(p.truncate(1).join(), "docs/notes");
    EXPECT_EQ(p.truncate(2).join(), "docs");
    EXPECT_EQ(p.parent(), p.truncate(1));
}

TEST_F(PathTest, TruncateClampsToRoot) {
    const Path p("/docs/readme.txt");
    EXPECT_TRUE(p.truncate(2).isRoot());
    EXPECT_TRUE(p.truncate(10).isRoot());
    EXPECT_TRUE(Path().truncate(1).empty());
}

TEST_F(PathTest, TailOfRootIsSlash) {
    EXPECT_EQ(Path("/docs/readme.txt").tail(), "readme.txt");
    EXPECT_EQ(Path("/").tail(), "/");
    EXPECT_EQ(Path().tail(), "/");
}

TEST_F(PathTest, JoinInvertsParse) {
    for (const std::string text : {"a", "a/b", "x/y/z.txt", "with space/ünïcode"}) {
        EXPECT_EQ(Path(text).join(), text);
        EXPECT_EQ(Path(Path(text).join()), Path(text));
    }
}

TEST_F(PathTest, AbsoluteFormHasLeadingSlash) {
    EXPECT_EQ(Path("a/b").toAbsolute(), "/a/b");
    EXPECT_EQ(Path().toAbsolute(), "/");
}

TEST_F(PathTest, ChildAppendsSegment) {
    EXPECT_EQ(Path("/a").child("b").toAbsolute(), "/a/b");
    EXPECT_EQ(Path().child("x").toAbsolute(), "/x");
}

TEST_F(PathTest, NamesAreOpaque) {
    const Path p("/dots/../and/./odd");
    EXPECT_EQ(p.size(), 5u);
    EXPECT_EQ(p.segments[1], "..");
}
