// tests/test_framework/shared_test_helpers.h
#pragma once

// Must be first: defines FSPEC_IS_POSIX before any platform-conditional includes.
#include "fsp_platform.hpp"

#include <filesystem>
namespace fs = std::filesystem;

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases: file I/O, scratch directories, stderr
 *        capture, thread racing and the worker-process wrappers.
 */

#if FSPEC_IS_POSIX
#include <fcntl.h>
#include <unistd.h>
#else
#include <cstdio>
#include <fcntl.h>
#include <io.h>
#define STDERR_FILENO _fileno(stderr)
typedef int ssize_t;
#endif

#include "gtest/gtest.h"

// LifecycleGuard, FSP_DEBUG, print_stack_trace
#include "fsp_service.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <string_view>
#include <thread>

namespace fspec::tests::helper
{

class StringCapture
{
  public:
    explicit StringCapture(int fd_to_capture) : fd_to_capture_(fd_to_capture), original_fd_(-1)
    {
#if FSPEC_IS_POSIX
        if (pipe(pipe_fds_) != 0)
            return;
        original_fd_ = dup(fd_to_capture_);
        dup2(pipe_fds_[1], fd_to_capture_);
        close(pipe_fds_[1]);
#else
        if (_pipe(pipe_fds_, 65536, _O_BINARY) != 0)
            return;
        original_fd_ = _dup(fd_to_capture_);
        _dup2(pipe_fds_[1], fd_to_capture_);
        _close(pipe_fds_[1]);
#endif
    }

    ~StringCapture()
    {
        if (original_fd_ != -1)
        {
#if FSPEC_IS_POSIX
            dup2(original_fd_, fd_to_capture_);
            close(original_fd_);
            close(pipe_fds_[0]);
#else
            _dup2(original_fd_, fd_to_capture_);
            _close(original_fd_);
            _close(pipe_fds_[0]);
#endif
        }
    }

    StringCapture(const StringCapture &) = delete;
    StringCapture &operator=(const StringCapture &) = delete;

    /// Restores the captured descriptor and returns what was written to it.
    std::string GetOutput()
    {
        if (original_fd_ == -1)
            return {};

        fflush(stderr);
        fflush(stdout);
#if FSPEC_IS_POSIX
        dup2(original_fd_, fd_to_capture_);
        close(original_fd_);
#else
        _dup2(original_fd_, fd_to_capture_);
        _close(original_fd_);
#endif
        original_fd_ = -1;

        std::string output;
        std::vector<char> buffer(1024);
        ssize_t bytes_read;
#if FSPEC_IS_POSIX
        while ((bytes_read = read(pipe_fds_[0], buffer.data(), buffer.size())) > 0)
        {
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
        close(pipe_fds_[0]);
#else
        while ((bytes_read = _read(pipe_fds_[0], buffer.data(),
                                   static_cast<unsigned int>(buffer.size()))) > 0)
        {
            output.append(buffer.data(), static_cast<size_t>(bytes_read));
        }
        _close(pipe_fds_[0]);
#endif
        return output;
    }

  private:
    int fd_to_capture_;
    int original_fd_;
    int pipe_fds_[2];
};

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/// Writes @p content to @p path, replacing it. Test setup only; not atomic.
bool write_file_contents(const fs::path &path, std::string_view content);

/**
 * @brief Counts lines of @p text, optionally only those containing
 *        @p must_include and not containing @p must_exclude.
 */
size_t count_lines(std::string_view text,
                   std::optional<std::string_view> must_include = std::nullopt,
                   std::optional<std::string_view> must_exclude = std::nullopt);

/**
 * @brief Polls a file until @p expected appears in it or @p timeout passes.
 */
bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout = std::chrono::seconds(15));

/**
 * @brief Value of `FSPEC_TEST_SCALE`, or an empty string.
 *
 * Set it to "small" to run lighter versions of the stress tests.
 */
std::string test_scale();

/// `small_value` when test_scale() is "small", otherwise `original`.
int scaled_value(int original, int small_value);

/**
 * @brief Creates a fresh, empty directory under the system temp directory.
 *
 * The name combines @p prefix, the pid and a counter, so parallel test
 * binaries never collide.
 */
fs::path make_scratch_dir(std::string_view prefix);

/// RAII owner of a make_scratch_dir() directory; removes it recursively on destruction.
class ScratchDir
{
  public:
    explicit ScratchDir(std::string_view prefix) : path_(make_scratch_dir(prefix)) {}
    ~ScratchDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const fs::path &path() const { return path_; }
    fs::path operator/(std::string_view name) const { return path_ / fs::path(name); }

  private:
    fs::path path_;
};

/**
 * @brief Runs @p test_logic inside a worker process with the given lifecycle modules.
 *
 * GoogleTest assertions throw (throw_on_failure), so a failed ASSERT_* or EXPECT_*
 * ends the worker with a non-zero exit code and a "[WORKER FAILURE]" line on stderr.
 *
 * @return 0 on success, 1 on assertion failure, 2 on a std::exception.
 */
template <typename Fn, typename... Mods>
int run_gtest_worker(Fn test_logic, const char *test_name, Mods &&...mods)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    fspec::utils::LifecycleGuard guard(
        fspec::utils::MakeModDefList(std::forward<Mods>(mods)...));

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}: \n{}\n", test_name,
                   e.what());
        fspec::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        fspec::debug::print_stack_trace();
        return 2;
    }
    return 0;
}

/**
 * @brief As run_gtest_worker, without initializing any lifecycle.
 *
 * For workers that drive the lifecycle themselves, or check behavior before it starts.
 */
template <typename Fn> int run_worker_bare(Fn test_logic, const char *test_name)
{
    ::testing::GTEST_FLAG(throw_on_failure) = true;

    try
    {
        test_logic();
    }
    catch (const ::testing::internal::GoogleTestFailureException &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] GTest assertion failed in {}: \n{}\n", test_name,
                   e.what());
        fspec::debug::print_stack_trace();
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[WORKER FAILURE] {} threw an exception: {}\n", test_name, e.what());
        fspec::debug::print_stack_trace();
        return 2;
    }
    return 0;
}

// ============================================================================
// ThreadRacer
// ============================================================================

/**
 * @brief Runs N threads that start together after a spin barrier.
 *
 * An exception thrown by a thread is stored and reported by race().
 *
 * @code
 *   ThreadRacer racer(8);
 *   ASSERT_TRUE(racer.race([&](int i) { files.transaction(path, bump); }));
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /// @return true if no thread threw.
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        // Stored here, rethrown to the test by first_error().
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();

        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

    /// what() of the first stored exception, for assertion messages.
    std::string first_error() const
    {
        for (const auto &p : exceptions_)
        {
            if (!p)
                continue;
            try
            {
                std::rethrow_exception(p);
            }
            catch (const std::exception &e)
            {
                return e.what();
            }
        }
        return {};
    }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

// ============================================================================
// Process ready signal
// ============================================================================

/**
 * @brief Writes the ready byte when FSP_TEST_READY_FD is set; no-op otherwise.
 *
 * Call from a worker once it reached the state the parent waits for.
 */
void signal_test_ready();

} // namespace fspec::tests::helper
