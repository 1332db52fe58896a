#include <gtest/gtest.h>
#include "sync/model/path.hpp"
#include "sync/Errors.hpp"

using namespace cs::sync;
using namespace cs::sync::model;

TEST(PathTest, AcceptsAbsoluteNestedPaths) {
    EXPECT_NO_THROW(validatePath("/main.py"));
    EXPECT_NO_THROW(validatePath("/src/lib/util.py"));
    EXPECT_TRUE(isValidPath("/a/b.c/d-e_f"));
}

TEST(PathTest, RejectsRelativeAndRoot) {
    EXPECT_THROW(validatePath(""), ValidationError);
    EXPECT_THROW(validatePath("main.py"), ValidationError);
    EXPECT_THROW(validatePath("/"), ValidationError);
}

TEST(PathTest, RejectsTraversalAndEmptySegments) {
    EXPECT_FALSE(isValidPath("/a/../b"));
    EXPECT_FALSE(isValidPath("/a/./b"));
    EXPECT_FALSE(isValidPath("/a//b"));
    EXPECT_FALSE(isValidPath("/a/b/"));
    EXPECT_FALSE(isValidPath("/a\\b"));
}

TEST(PathTest, RejectsOverlongPath) {
    EXPECT_FALSE(isValidPath("/" + std::string(1024, 'x')));
    EXPECT_TRUE(isValidPath("/" + std::string(1000, 'x')));
}

TEST(PathTest, ToWorkspacePathNormalizesLeadingMarkers) {
    EXPECT_EQ(toWorkspacePath("dir/a.py"), "/dir/a.py");
    EXPECT_EQ(toWorkspacePath("./dir/a.py"), "/dir/a.py");
    EXPECT_EQ(toWorkspacePath("/dir/a.py"), "/dir/a.py");
    EXPECT_THROW(toWorkspacePath("../a.py"), ValidationError);
}
