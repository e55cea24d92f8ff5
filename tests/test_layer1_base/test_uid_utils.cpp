/**
 * @file test_uid_utils.cpp
 * @brief Layer 1 tests for temp-file suffixes and lock tokens.
 */
#include "fsp_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <set>

using namespace ::testing;

TEST(UidUtilsTest, TempSuffix_Format)
{
    const std::string s = fspec::uid::generate_temp_suffix();
    EXPECT_THAT(s, MatchesRegex(R"(^[0-9]+_[0-9A-F]{8}$)"));
    EXPECT_THAT(s, StartsWith(std::to_string(fspec::platform::get_pid()) + "_"));
}

TEST(UidUtilsTest, LockToken_Format)
{
    const std::string t = fspec::uid::generate_lock_token();
    EXPECT_THAT(t, MatchesRegex(R"(^[0-9]+-[0-9A-F]{16}$)"));
    EXPECT_THAT(t, StartsWith(std::to_string(fspec::platform::get_pid()) + "-"));
}

TEST(UidUtilsTest, LockTokens_AreDistinct)
{
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i)
    {
        seen.insert(fspec::uid::generate_lock_token());
    }
    EXPECT_EQ(seen.size(), 1000u);
}
