#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <util/string_utils.hpp>

TEST(Utils, Dirname) {
    EXPECT_EQ(posix_dirname("/a/b"), "/a");
    EXPECT_EQ(posix_dirname("/a/b/"), "/a");
    EXPECT_EQ(posix_dirname("/a"), "/");
    EXPECT_EQ(posix_dirname("a"), ".");
    EXPECT_EQ(posix_dirname("a/b"), "a");
}

TEST(Utils, Basename) {
    EXPECT_EQ(posix_basename("/a/b"), "b");
    EXPECT_EQ(posix_basename("/a/b/"), "b");
    EXPECT_EQ(posix_basename("b"), "b");
}

TEST(Utils, Join) {
    EXPECT_EQ(posix_join("/a", "b"), "/a/b");
    EXPECT_EQ(posix_join("/", "b"), "/b");
    EXPECT_EQ(posix_join("/a/", "b"), "/a/b");
}

TEST(Utils, MsysPath) {
    EXPECT_EQ(resolve_msys_path("C:\\Users\\me\\app"), "/C/Users/me/app");
    EXPECT_EQ(resolve_msys_path("/home/me/app"), "/home/me/app");
    EXPECT_EQ(resolve_msys_path("relative/path"), "relative/path");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", 7), 7);
    EXPECT_EQ(safe_stoi("", -1), -1);
}

TEST(StringUtils, SplitKeepsEmptyFields) {
    auto parts = StringUtils::split("/usr/bin::/bin", ':');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "/usr/bin");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "/bin");
}

TEST(StringUtils, JoinAndTrim) {
    EXPECT_EQ(StringUtils::join({"a", "b", "c"}, " "), "a b c");
    EXPECT_EQ(StringUtils::join({}, " "), "");
    EXPECT_EQ(StringUtils::trim("  x y \n"), "x y");
}
