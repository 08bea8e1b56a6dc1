#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(copysort::build_info::git_commit.empty());
    EXPECT_FALSE(copysort::build_info::git_commit_short.empty());
    // "unknown" вне git тоже 7 символов
    EXPECT_EQ(copysort::build_info::git_commit_short.size(), 7);
}

TEST(BuildInfoTest, GitInfoMatchesConstants)
{
    constexpr auto info = copysort::build_info::get_git_info();
    EXPECT_EQ(info.commit, copysort::build_info::git_commit);
    EXPECT_EQ(info.dirty, copysort::build_info::git_dirty);
    EXPECT_FALSE(info.version.empty());
}
