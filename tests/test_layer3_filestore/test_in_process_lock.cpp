/**
 * @file test_in_process_lock.cpp
 * @brief InProcessLockRegistry: reader sharing, writer exclusion and the wake-up policy.
 *
 * The registry needs no lifecycle, so these run in-process. Release of a lock
 * that is not held panics and is covered by death tests.
 */
#include "fsp_filestore.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace fspec::utils;
using namespace fspec::tests::helper;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

namespace
{
/// Polls until @p pred holds; false after @p timeout.
bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout = 5s)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}
} // namespace

class InProcessLockTest : public fspec::tests::PureApiTest
{
  protected:
    InProcessLockRegistry registry;
    const fs::path path = fs::temp_directory_path() / "fspec_ipl_test" / "state.json";
};

TEST_F(InProcessLockTest, ReadersShareTheLock)
{
    registry.acquire_read(path);
    registry.acquire_read(path);
    registry.acquire_read(path);

    auto snap = registry.snapshot(path);
    EXPECT_EQ(snap.reader_count, 3u);
    EXPECT_FALSE(snap.writer_held);
    EXPECT_EQ(snap.waiting_readers, 0u);

    registry.release_read(path);
    registry.release_read(path);
    registry.release_read(path);
    EXPECT_EQ(registry.snapshot(path).reader_count, 0u);
}

TEST_F(InProcessLockTest, UnknownPathHasEmptySnapshot)
{
    auto snap = registry.snapshot(path);
    EXPECT_EQ(snap.reader_count, 0u);
    EXPECT_FALSE(snap.writer_held);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(InProcessLockTest, EquivalentPathsShareOneState)
{
    const fs::path dotted = path.parent_path() / "sub" / ".." / "state.json";
    EXPECT_EQ(canonical_lock_key(path), canonical_lock_key(dotted));

    registry.acquire_write(dotted);
    EXPECT_TRUE(registry.snapshot(path).writer_held);
    registry.release_write(path);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(InProcessLockTest, WriterBlocksReaders)
{
    registry.acquire_write(path);

    std::atomic<bool> read_done{false};
    std::thread reader(
        [&]
        {
            registry.acquire_read(path);
            read_done = true;
            registry.release_read(path);
        });

    ASSERT_TRUE(wait_until([&] { return registry.snapshot(path).waiting_readers == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(read_done);

    registry.release_write(path);
    reader.join();
    EXPECT_TRUE(read_done);
}

TEST_F(InProcessLockTest, WriterWaitsForAllReaders)
{
    registry.acquire_read(path);
    registry.acquire_read(path);

    std::atomic<bool> write_done{false};
    std::thread writer(
        [&]
        {
            registry.acquire_write(path);
            write_done = true;
            registry.release_write(path);
        });

    ASSERT_TRUE(wait_until([&] { return registry.snapshot(path).waiting_writers == 1; }));
    registry.release_read(path);
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(write_done) << "one reader still holds the lock";

    registry.release_read(path);
    writer.join();
    EXPECT_TRUE(write_done);
}

TEST_F(InProcessLockTest, ReaderArrivingWhileWriterWaitsIsNotBlocked)
{
    registry.acquire_read(path);
    std::thread writer(
        [&]
        {
            registry.acquire_write(path);
            registry.release_write(path);
        });
    ASSERT_TRUE(wait_until([&] { return registry.snapshot(path).waiting_writers == 1; }));

    // Readers only queue behind a writer that holds the lock.
    registry.acquire_read(path);
    EXPECT_EQ(registry.snapshot(path).reader_count, 2u);

    registry.release_read(path);
    registry.release_read(path);
    writer.join();
}

TEST_F(InProcessLockTest, WriteReleaseWakesAllReadersBeforeNextWriter)
{
    registry.acquire_write(path);

    std::mutex order_mtx;
    std::vector<std::string> order;
    auto note = [&](std::string what)
    {
        std::lock_guard<std::mutex> lk(order_mtx);
        order.push_back(std::move(what));
    };

    std::thread w2(
        [&]
        {
            registry.acquire_write(path);
            note("writer");
            registry.release_write(path);
        });
    ASSERT_TRUE(wait_until([&] { return registry.snapshot(path).waiting_writers == 1; }));

    std::atomic<int> readers_in{0};
    std::atomic<bool> let_readers_go{false};
    std::vector<std::thread> readers;
    for (int i = 0; i < 3; ++i)
    {
        readers.emplace_back(
            [&]
            {
                registry.acquire_read(path);
                ++readers_in;
                while (!let_readers_go)
                    std::this_thread::sleep_for(1ms);
                note("reader");
                registry.release_read(path);
            });
    }
    ASSERT_TRUE(wait_until([&] { return registry.snapshot(path).waiting_readers == 3; }));

    registry.release_write(path);

    // All three readers are in together while the writer still waits.
    ASSERT_TRUE(wait_until([&] { return readers_in == 3; }));
    auto snap = registry.snapshot(path);
    EXPECT_EQ(snap.reader_count, 3u);
    EXPECT_EQ(snap.waiting_writers, 1u);

    let_readers_go = true;
    for (auto &t : readers)
        t.join();
    w2.join();

    EXPECT_THAT(order, ElementsAre("reader", "reader", "reader", "writer"));
}

TEST_F(InProcessLockTest, WritersAreServedInArrivalOrder)
{
    registry.acquire_write(path);

    std::mutex order_mtx;
    std::vector<int> order;
    std::vector<std::thread> writers;
    for (int i = 0; i < 3; ++i)
    {
        writers.emplace_back(
            [&, i]
            {
                registry.acquire_write(path);
                {
                    std::lock_guard<std::mutex> lk(order_mtx);
                    order.push_back(i);
                }
                registry.release_write(path);
            });
        ASSERT_TRUE(
            wait_until([&] { return registry.snapshot(path).waiting_writers == size_t(i + 1); }));
    }

    registry.release_write(path);
    for (auto &t : writers)
        t.join();
    EXPECT_THAT(order, ElementsAre(0, 1, 2));
}

TEST_F(InProcessLockTest, WritersNeverOverlap)
{
    const int kThreads = 8;
    const int kIterations = scaled_value(500, 50);
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    int counter = 0;

    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            for (int i = 0; i < kIterations; ++i)
            {
                InProcessLockRegistry::WriteGuard guard(registry, path);
                const int now = ++inside;
                int seen = max_inside.load();
                while (now > seen && !max_inside.compare_exchange_weak(seen, now))
                {
                }
                ++counter;
                --inside;
            }
        }))
        << racer.first_error();

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(counter, kThreads * kIterations);
    auto snap = registry.snapshot(path);
    EXPECT_FALSE(snap.writer_held);
    EXPECT_EQ(snap.waiting_writers, 0u);
}

TEST_F(InProcessLockTest, ReadersAndWritersNeverOverlap)
{
    const int kIterations = scaled_value(300, 30);
    std::atomic<int> readers_inside{0};
    std::atomic<int> writers_inside{0};
    std::atomic<bool> violation{false};

    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race(
        [&](int idx)
        {
            for (int i = 0; i < kIterations; ++i)
            {
                if (idx % 4 == 0)
                {
                    InProcessLockRegistry::WriteGuard guard(registry, path);
                    if (++writers_inside != 1 || readers_inside != 0)
                        violation = true;
                    --writers_inside;
                }
                else
                {
                    InProcessLockRegistry::ReadGuard guard(registry, path);
                    ++readers_inside;
                    if (writers_inside != 0)
                        violation = true;
                    --readers_inside;
                }
            }
        }))
        << racer.first_error();

    EXPECT_FALSE(violation);
}

TEST_F(InProcessLockTest, ReadersHoldConcurrently)
{
    const int kReaders = 4;
    const auto kHold = 100ms;
    const auto start = std::chrono::steady_clock::now();

    ThreadRacer racer(kReaders);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            InProcessLockRegistry::ReadGuard guard(registry, path);
            std::this_thread::sleep_for(kHold);
        }));

    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, kHold * kReaders);
}

TEST_F(InProcessLockTest, DifferentPathsAreIndependent)
{
    const fs::path other = path.parent_path() / "other.json";
    registry.acquire_write(path);

    std::atomic<bool> done{false};
    std::thread t(
        [&]
        {
            InProcessLockRegistry::WriteGuard w(registry, other);
            InProcessLockRegistry::ReadGuard r(registry, other.parent_path() / "third.json");
            done = true;
        });
    EXPECT_TRUE(wait_until([&] { return done.load(); }, 2s));
    t.join();

    registry.release_write(path);
}

TEST_F(InProcessLockTest, GuardsReleaseOnException)
{
    EXPECT_THROW(
        {
            InProcessLockRegistry::WriteGuard guard(registry, path);
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    EXPECT_FALSE(registry.snapshot(path).writer_held);

    EXPECT_THROW(
        {
            InProcessLockRegistry::ReadGuard guard(registry, path);
            throw std::runtime_error("boom");
        },
        std::runtime_error);
    EXPECT_EQ(registry.snapshot(path).reader_count, 0u);
}

TEST_F(InProcessLockTest, ResetForgetsIdlePaths)
{
    registry.acquire_read(path);
    registry.release_read(path);
    registry.acquire_write(path.parent_path() / "b.json");
    registry.release_write(path.parent_path() / "b.json");
    EXPECT_EQ(registry.size(), 2u);

    registry.reset();
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(InProcessLockTest, RegistriesAreIndependent)
{
    InProcessLockRegistry second;
    registry.acquire_write(path);
    second.acquire_write(path);
    EXPECT_TRUE(second.snapshot(path).writer_held);
    second.release_write(path);
    registry.release_write(path);
}

// ============================================================================
// Misuse panics
// ============================================================================

class InProcessLockDeathTest : public InProcessLockTest
{
};

TEST_F(InProcessLockDeathTest, ReleaseReadWithoutReaderPanics)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(registry.release_read(path), "has no reader to release");
}

TEST_F(InProcessLockDeathTest, ReleaseWriteWithoutWriterPanics)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    registry.acquire_read(path);
    EXPECT_DEATH(registry.release_write(path), "has no writer to release");
    registry.release_read(path);
}

TEST_F(InProcessLockDeathTest, ResetWhileHeldPanics)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    registry.acquire_write(path);
    EXPECT_DEATH(registry.reset(), "is still in use");
    registry.release_write(path);
}
