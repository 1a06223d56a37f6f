#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(objcp::build_info::git_commit.empty());
    EXPECT_FALSE(objcp::build_info::git_commit_short.empty());
    EXPECT_LE(objcp::build_info::git_commit_short.size(), 7u);
}

TEST(BuildInfoTest, GitInfoMirrorsConstants)
{
    constexpr auto info = objcp::build_info::get_git_info();
    EXPECT_EQ(info.commit, objcp::build_info::git_commit);
    EXPECT_EQ(info.dirty, objcp::build_info::git_dirty);
    EXPECT_FALSE(info.timestamp.empty());
}
