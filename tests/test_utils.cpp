#include <gtest/gtest.h>
#include <core/types.hpp>
#include <core/utils.hpp>

TEST(Utils, SafeStoiFallsBack) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

TEST(Utils, GenerateIdHasPrefixAndIsUnique) {
    auto a = generate_id("sess");
    auto b = generate_id("sess");
    EXPECT_EQ(a.rfind("sess-", 0), 0u);
    EXPECT_EQ(a.size(), 5u + 16u);
    EXPECT_NE(a, b);
}

TEST(Utils, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(shell_quote("plain"), "'plain'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
}

TEST(Utils, JoinRemote) {
    EXPECT_EQ(join_remote("/srv", "a.txt"), "/srv/a.txt");
    EXPECT_EQ(join_remote("/srv/", "/a.txt"), "/srv/a.txt");
    EXPECT_EQ(join_remote("/", "a.txt"), "/a.txt");
    EXPECT_EQ(join_remote("", "a.txt"), "a.txt");
}

TEST(Utils, RemoteParentAndBasename) {
    EXPECT_EQ(remote_parent("/srv/data/a.txt"), "/srv/data");
    EXPECT_EQ(remote_parent("/a.txt"), "/");
    EXPECT_EQ(remote_parent("a.txt"), "");
    EXPECT_EQ(remote_basename("/srv/data/a.txt"), "a.txt");
    EXPECT_EQ(remote_basename("/srv/data/"), "data");
}

TEST(Utils, Trim) {
    std::string s = "  \thello\r\n";
    trim(s);
    EXPECT_EQ(s, "hello");
    std::string blank = " \n";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(Utils, ErrorDescribeNamesOperationAndId) {
    auto e = make_error(ErrorKind::ChannelLimitExceeded, "open-channel", "sftp", "10 of 10 channels in use");
    EXPECT_EQ(e.describe(), "open-channel [sftp]: ChannelLimitExceeded: 10 of 10 channels in use");
    EXPECT_EQ(Error{}.describe(), "");
}
