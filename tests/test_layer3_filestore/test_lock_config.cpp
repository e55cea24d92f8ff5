/**
 * @file test_lock_config.cpp
 * @brief LockConfig parsing, environment overrides and sanitizing.
 */
#include "filestore_test_support.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

using namespace fspec::utils;
using namespace fspec::tests;
using namespace fspec::tests::helper;
using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class LockConfigTest : public PureApiTest
{
};

TEST_F(LockConfigTest, Defaults)
{
    LockConfig cfg;
    EXPECT_EQ(cfg.stale, 10000ms);
    EXPECT_EQ(cfg.retries, 10);
    EXPECT_EQ(cfg.min_timeout, 50ms);
    EXPECT_EQ(cfg.max_timeout, 500ms);
    EXPECT_DOUBLE_EQ(cfg.factor, 2.0);
    EXPECT_EQ(cfg.update, 5000ms);
    EXPECT_FALSE(cfg.debug_locks);

    // The defaults need no adjustment.
    EXPECT_THAT(cfg.sanitize(), IsEmpty());
}

TEST_F(LockConfigTest, BackoffFollowsTimeouts)
{
    LockConfig cfg;
    auto b = cfg.backoff();
    EXPECT_EQ(b.delay_for(0), 50ms);
    EXPECT_EQ(b.delay_for(3), 400ms);
    EXPECT_EQ(b.delay_for(4), 500ms);

    cfg.min_timeout = 5ms;
    cfg.max_timeout = 15ms;
    cfg.factor = 3.0;
    b = cfg.backoff();
    EXPECT_EQ(b.delay_for(0), 5ms);
    EXPECT_EQ(b.delay_for(1), 15ms);
    EXPECT_EQ(b.delay_for(2), 15ms);
}

TEST_F(LockConfigTest, FromJson_OverlaysPresentKeys)
{
    LockConfig base;
    base.retries = 3;
    const auto doc = nlohmann::json::parse(R"({
        "min_timeout_ms": 10,
        "max_timeout_ms": 40,
        "factor": 1.5,
        "debug_locks": true
    })");

    LockConfig cfg = LockConfig::from_json(doc, base);
    EXPECT_EQ(cfg.min_timeout, 10ms);
    EXPECT_EQ(cfg.max_timeout, 40ms);
    EXPECT_DOUBLE_EQ(cfg.factor, 1.5);
    EXPECT_TRUE(cfg.debug_locks);
    EXPECT_EQ(cfg.retries, 3);
    EXPECT_EQ(cfg.stale, 10000ms);
}

TEST_F(LockConfigTest, FromJson_UpdateFollowsStaleUnlessGiven)
{
    LockConfig cfg = LockConfig::from_json(nlohmann::json{{"stale_ms", 8000}}, LockConfig{});
    EXPECT_EQ(cfg.stale, 8000ms);
    EXPECT_EQ(cfg.update, 4000ms);

    cfg = LockConfig::from_json(nlohmann::json{{"stale_ms", 8000}, {"update_ms", 1000}},
                                LockConfig{});
    EXPECT_EQ(cfg.update, 1000ms);
}

TEST_F(LockConfigTest, FromJson_RejectsWrongTypes)
{
    EXPECT_THROW(LockConfig::from_json(nlohmann::json::array(), LockConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(LockConfig::from_json(nlohmann::json{{"stale_ms", "10s"}}, LockConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(LockConfig::from_json(nlohmann::json{{"stale_ms", -1}}, LockConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(LockConfig::from_json(nlohmann::json{{"retries", 2.5}}, LockConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(LockConfig::from_json(nlohmann::json{{"factor", "2"}}, LockConfig{}),
                 std::invalid_argument);
    EXPECT_THROW(LockConfig::from_json(nlohmann::json{{"debug_locks", 1}}, LockConfig{}),
                 std::invalid_argument);
}

TEST_F(LockConfigTest, FromJson_IgnoresUnknownKeys)
{
    LockConfig cfg = LockConfig::from_json(nlohmann::json{{"colour", "blue"}}, LockConfig{});
    EXPECT_EQ(cfg.retries, 10);
}

TEST_F(LockConfigTest, Sanitize_ClampsEachValue)
{
    LockConfig cfg;
    cfg.stale = 500ms;
    cfg.update = 0ms;
    cfg.retries = -4;
    cfg.min_timeout = 0ms;
    cfg.max_timeout = 0ms;
    cfg.factor = 0.25;

    const auto warnings = cfg.sanitize();
    EXPECT_THAT(warnings, SizeIs(6));
    EXPECT_EQ(cfg.stale, LockConfig::kMinStale);
    EXPECT_EQ(cfg.update, LockConfig::kMinStale / 2);
    EXPECT_EQ(cfg.retries, 0);
    EXPECT_EQ(cfg.min_timeout, 1ms);
    EXPECT_EQ(cfg.max_timeout, 1ms);
    EXPECT_DOUBLE_EQ(cfg.factor, 1.0);
}

TEST_F(LockConfigTest, Sanitize_UpdateMustStayBelowStale)
{
    LockConfig cfg;
    cfg.stale = 4000ms;
    cfg.update = 4000ms;
    const auto warnings = cfg.sanitize();
    ASSERT_THAT(warnings, SizeIs(1));
    EXPECT_THAT(warnings[0], HasSubstr("update_ms"));
    EXPECT_EQ(cfg.update, 2000ms);
}

TEST_F(LockConfigTest, Sanitize_MinAboveMaxRaisesMax)
{
    LockConfig cfg;
    cfg.min_timeout = 800ms;
    cfg.max_timeout = 100ms;
    EXPECT_THAT(cfg.sanitize(), SizeIs(1));
    EXPECT_EQ(cfg.min_timeout, 800ms);
    EXPECT_EQ(cfg.max_timeout, 800ms);
}

TEST_F(LockConfigTest, Environment_Overrides)
{
    ScopedEnv debug("FSPEC_DEBUG_LOCKS", "1");
    ScopedEnv stale("FSPEC_LOCK_STALE_MS", "6000");
    ScopedEnv retries("FSPEC_LOCK_RETRIES", "25");

    LockConfig cfg;
    EXPECT_THAT(cfg.apply_environment(), IsEmpty());
    EXPECT_TRUE(cfg.debug_locks);
    EXPECT_EQ(cfg.stale, 6000ms);
    EXPECT_EQ(cfg.update, 3000ms);
    EXPECT_EQ(cfg.retries, 25);
}

TEST_F(LockConfigTest, Environment_FalsyDebugFlagDisables)
{
    for (const char *value : {"0", "false", "OFF", "no", ""})
    {
        ScopedEnv debug("FSPEC_DEBUG_LOCKS", value);
        LockConfig cfg;
        cfg.debug_locks = true;
        cfg.apply_environment();
        EXPECT_FALSE(cfg.debug_locks) << "FSPEC_DEBUG_LOCKS='" << value << "'";
    }
}

TEST_F(LockConfigTest, Environment_MalformedValuesWarnAndAreIgnored)
{
    ScopedEnv stale("FSPEC_LOCK_STALE_MS", "ten seconds");
    ScopedEnv retries("FSPEC_LOCK_RETRIES", "-3");

    LockConfig cfg;
    const auto warnings = cfg.apply_environment();
    ASSERT_THAT(warnings, SizeIs(2));
    EXPECT_THAT(warnings[0], HasSubstr("FSPEC_LOCK_STALE_MS"));
    EXPECT_THAT(warnings[1], HasSubstr("FSPEC_LOCK_RETRIES"));
    EXPECT_EQ(cfg.stale, 10000ms);
    EXPECT_EQ(cfg.retries, 10);
}

TEST_F(LockConfigTest, Environment_RetriesAreCapped)
{
    ScopedEnv retries("FSPEC_LOCK_RETRIES", "999999");
    LockConfig cfg;
    cfg.apply_environment();
    EXPECT_EQ(cfg.retries, 1000);
}

// ============================================================================
// load(): needs the Logger for its warnings.
// ============================================================================

class LockConfigLoadTest : public ::testing::Test
{
  protected:
    static void SetUpTestSuite() { ensure_filestore_lifecycle(); }
};

TEST_F(LockConfigLoadTest, LoadsFileThenEnvironmentThenSanitizes)
{
    ScratchDir dir("lockcfg");
    const fs::path file = dir / "locks.json";
    ASSERT_TRUE(write_file_contents(
        file, R"({"stale_ms": 1000, "retries": 4, "min_timeout_ms": 5, "max_timeout_ms": 7})"));
    ScopedEnv retries("FSPEC_LOCK_RETRIES", "9");
    ScopedEnv stale("FSPEC_LOCK_STALE_MS", nullptr);
    ScopedEnv debug("FSPEC_DEBUG_LOCKS", nullptr);

    LockConfig cfg = LockConfig::load(file);
    EXPECT_EQ(cfg.retries, 9);
    EXPECT_EQ(cfg.stale, LockConfig::kMinStale);
    EXPECT_EQ(cfg.update, 500ms);
    EXPECT_EQ(cfg.min_timeout, 5ms);
    EXPECT_EQ(cfg.max_timeout, 7ms);
}

TEST_F(LockConfigLoadTest, MissingOrMalformedFileKeepsDefaults)
{
    ScratchDir dir("lockcfg");
    ScopedEnv retries("FSPEC_LOCK_RETRIES", nullptr);
    ScopedEnv stale("FSPEC_LOCK_STALE_MS", nullptr);

    EXPECT_EQ(LockConfig::load(dir / "absent.json").retries, 10);

    const fs::path broken = dir / "broken.json";
    ASSERT_TRUE(write_file_contents(broken, "{ \"retries\": "));
    EXPECT_EQ(LockConfig::load(broken).retries, 10);

    const fs::path wrong = dir / "wrong.json";
    ASSERT_TRUE(write_file_contents(wrong, R"({"retries": "many"})"));
    EXPECT_EQ(LockConfig::load(wrong).retries, 10);
}

TEST_F(LockConfigLoadTest, CurrentIsAvailableAfterStartup)
{
    ASSERT_TRUE(LockConfig::lifecycle_initialized());
    LockConfig cfg = LockConfig::current();
    EXPECT_GE(cfg.stale, LockConfig::kMinStale);
    EXPECT_LT(cfg.update, cfg.stale);
}
