/**
 * @file test_atomic_writer.cpp
 * @brief atomic_write_file: full replacement, temp-file hygiene and refusal cases.
 */
#include "filestore_test_support.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <regex>
#include <thread>

#if FSPEC_IS_POSIX
#include <unistd.h>
#endif

using namespace fspec::utils;
using namespace fspec::tests;
using namespace fspec::tests::helper;
using ::testing::StartsWith;

namespace
{
std::vector<fs::path> temp_files_in(const fs::path &dir)
{
    std::vector<fs::path> out;
    for (const auto &entry : fs::directory_iterator(dir))
    {
        if (entry.path().filename().string().find(".tmp.") != std::string::npos)
            out.push_back(entry.path());
    }
    return out;
}
} // namespace

class AtomicWriterTest : public ::testing::Test
{
  protected:
    static void SetUpTestSuite() { ensure_filestore_lifecycle(); }

    ScratchDir dir{"atomic"};
};

TEST_F(AtomicWriterTest, CreatesNewFile)
{
    const fs::path target = dir / "new.json";
    std::error_code ec;
    atomic_write_file(target, "{\"a\": 1}\n", ec);
    ASSERT_FALSE(ec) << ec.message();

    std::string content;
    ASSERT_TRUE(read_file_contents(target.string(), content));
    EXPECT_EQ(content, "{\"a\": 1}\n");
    EXPECT_TRUE(temp_files_in(dir.path()).empty());
}

TEST_F(AtomicWriterTest, ReplacesExistingContentEntirely)
{
    const fs::path target = dir / "state.json";
    ASSERT_TRUE(write_file_contents(target, std::string(4096, 'x')));

    std::error_code ec;
    atomic_write_file(target, "short", ec);
    ASSERT_FALSE(ec) << ec.message();

    std::string content;
    ASSERT_TRUE(read_file_contents(target.string(), content));
    EXPECT_EQ(content, "short");
}

TEST_F(AtomicWriterTest, EmptyContentIsValid)
{
    const fs::path target = dir / "empty.json";
    std::error_code ec;
    atomic_write_file(target, "", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(fs::file_size(target), 0u);
}

TEST_F(AtomicWriterTest, CreatesMissingParentDirectories)
{
    const fs::path target = dir / "a" / "b" / "c.json";
    std::error_code ec;
    atomic_write_file(target, "{}", ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(fs::exists(target));
}

TEST_F(AtomicWriterTest, RejectsEmptyPath)
{
    std::error_code ec;
    atomic_write_file(fs::path(), "{}", ec);
    EXPECT_EQ(ec, std::errc::invalid_argument);
}

#if FSPEC_IS_POSIX
TEST_F(AtomicWriterTest, RefusesToReplaceSymlink)
{
    const fs::path real = dir / "real.json";
    const fs::path link = dir / "link.json";
    ASSERT_TRUE(write_file_contents(real, "original"));
    fs::create_symlink(real, link);

    std::error_code ec;
    atomic_write_file(link, "replaced", ec);
    EXPECT_EQ(ec, std::errc::operation_not_permitted);

    std::string content;
    ASSERT_TRUE(read_file_contents(real.string(), content));
    EXPECT_EQ(content, "original");
    EXPECT_TRUE(fs::is_symlink(link));
    EXPECT_TRUE(temp_files_in(dir.path()).empty());
}

TEST_F(AtomicWriterTest, KeepsPermissionBitsOfExistingTarget)
{
    const fs::path target = dir / "perm.json";
    ASSERT_TRUE(write_file_contents(target, "old"));
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write);

    std::error_code ec;
    atomic_write_file(target, "new", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(fs::status(target).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(AtomicWriterTest, FailureLeavesTargetUntouched)
{
    if (::geteuid() == 0)
        GTEST_SKIP() << "root ignores directory permissions";

    const fs::path sub = dir / "locked";
    fs::create_directories(sub);
    const fs::path target = sub / "state.json";
    ASSERT_TRUE(write_file_contents(target, "original"));
    fs::permissions(sub, fs::perms::owner_read | fs::perms::owner_exec);

    std::error_code ec;
    atomic_write_file(target, "replacement", ec);
    fs::permissions(sub, fs::perms::owner_all);

    EXPECT_TRUE(ec);
    std::string content;
    ASSERT_TRUE(read_file_contents(target.string(), content));
    EXPECT_EQ(content, "original");
    EXPECT_TRUE(temp_files_in(sub).empty());
}
#endif

TEST_F(AtomicWriterTest, TempPathIsUniqueSibling)
{
    const fs::path target = dir / "state.json";
    const fs::path a = make_temp_path(target);
    const fs::path b = make_temp_path(target);

    EXPECT_NE(a, b);
    EXPECT_EQ(a.parent_path(), target.parent_path());
    EXPECT_THAT(a.filename().string(), StartsWith("state.json.tmp."));
    EXPECT_TRUE(std::regex_match(a.filename().string(),
                                 std::regex(R"(state\.json\.tmp\.[0-9]+_[0-9A-F]{8})")));
}

// A reader racing the writer sees one of the complete versions, never a mix.
TEST_F(AtomicWriterTest, ConcurrentReaderNeverSeesPartialContent)
{
    const fs::path target = dir / "big.json";
    const std::string v1(64 * 1024, 'a');
    const std::string v2(96 * 1024, 'b');
    std::error_code ec;
    atomic_write_file(target, v1, ec);
    ASSERT_FALSE(ec);

    const int kWrites = scaled_value(200, 20);
    std::atomic<bool> done{false};
    std::atomic<int> bad_reads{0};
    std::atomic<int> reads{0};

    std::thread reader(
        [&]
        {
            while (!done)
            {
                std::string content;
                if (!read_file_contents(target.string(), content))
                    continue;
                ++reads;
                if (content != v1 && content != v2)
                    ++bad_reads;
            }
        });

    std::error_code wec;
    for (int i = 0; i < kWrites && !wec; ++i)
        atomic_write_file(target, (i % 2) ? v1 : v2, wec);
    done = true;
    reader.join();

    EXPECT_FALSE(wec) << wec.message();
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(bad_reads.load(), 0);
    EXPECT_TRUE(temp_files_in(dir.path()).empty());
}
