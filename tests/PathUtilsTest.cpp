#include <gtest/gtest.h>
#include "Utils/PathUtils.hpp"
#include <cstdlib>

TEST(PathUtilsTest, ExpandUserReplacesLeadingTilde) {
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(PathUtils::expandUser("~/.ssh/id_ed25519"), std::filesystem::path("/home/tester/.ssh/id_ed25519"));
    EXPECT_EQ(PathUtils::expandUser("~"), std::filesystem::path("/home/tester"));
}

TEST(PathUtilsTest, ExpandUserLeavesOtherPathsAlone) {
    EXPECT_EQ(PathUtils::expandUser("/etc/hostname"), std::filesystem::path("/etc/hostname"));
    EXPECT_EQ(PathUtils::expandUser("relative/~/dir"), std::filesystem::path("relative/~/dir"));
    EXPECT_EQ(PathUtils::expandUser("~other/file"), std::filesystem::path("~other/file"));
}

TEST(PathUtilsTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(PathUtils::shellQuote("nginx"), "'nginx'");
    EXPECT_EQ(PathUtils::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(PathUtils::shellQuote(""), "''");
}

TEST(PathUtilsTest, RemoteParent) {
    EXPECT_EQ(PathUtils::remoteParent("/opt/lab/file.txt"), "/opt/lab");
    EXPECT_EQ(PathUtils::remoteParent("/file.txt"), "/");
    EXPECT_EQ(PathUtils::remoteParent("file.txt"), ".");
    EXPECT_EQ(PathUtils::remoteParent("/opt/lab/"), "/opt");
}
