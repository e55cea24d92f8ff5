#pragma once
/**
 * @file inter_process_lock.hpp
 * @brief Exclusive lock between processes, based on a `<file>.lock` side file.
 *
 * The lock for `/data/state.json` is the file `/data/state.json.lock`, created
 * with `O_CREAT | O_EXCL`. Whoever creates it owns the lock; it records
 *
 *   {"pid": 4242, "host": "build01", "token": "4242-9E1D4C2AB3F12E9A",
 *    "acquired_at": "2026-01-05 10:22:13.123456"}
 *
 * **Acquisition.** An existing lock file is reclaimed (with a warning) when it is
 * stale: its mtime is older than `LockConfig::stale`, or it was written on this
 * host by a process that no longer exists. Otherwise acquisition backs off
 * exponentially (`LockConfig::min_timeout` .. `max_timeout`) and gives up after
 * `LockConfig::retries` retries with `std::errc::timed_out`.
 *
 * **Holding.** Threads of one process share a single hold on a lock file: the
 * first thread creates it, later threads join while it is held, and the last
 * one to release deletes it. Exclusion between the threads themselves is the
 * job of `InProcessLockRegistry`. While a hold exists the keeper thread
 * (started by this module's lifecycle) refreshes the file's mtime every
 * `LockConfig::update` and checks that it still carries our token. A missing or
 * foreign lock file marks the hold compromised: `verify()` then returns
 * `std::errc::owner_dead`.
 *
 * **Release** is idempotent and also performed by the destructor. A lock file
 * that no longer carries our token is left alone.
 *
 * Creating an InterProcessLock before the "fspec::utils::InterProcessLock"
 * module is initialized panics; `try_lock()` returns std::nullopt instead.
 */
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include "fspec_utils_export.h"
#include "utils/lock_config.hpp"
#include "utils/module_def.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace fspec::utils
{

struct InterProcessLockImpl;

class FSPEC_UTILS_EXPORT InterProcessLock
{
  public:
    /**
     * @brief Acquires the lock for @p target, blocking through the retry budget.
     *
     * Failure is not an exception: check `valid()` and `error_code()`
     * (`timed_out` when the budget ran out, an OS error otherwise).
     */
    InterProcessLock(const std::filesystem::path &target, const LockConfig &config) noexcept;

    /// As the constructor; std::nullopt on failure or before lifecycle init.
    static std::optional<InterProcessLock> try_lock(const std::filesystem::path &target,
                                                    const LockConfig &config,
                                                    std::error_code *ec = nullptr) noexcept;

    ~InterProcessLock();
    InterProcessLock(InterProcessLock &&) noexcept;
    InterProcessLock &operator=(InterProcessLock &&) noexcept;
    InterProcessLock(const InterProcessLock &) = delete;
    InterProcessLock &operator=(const InterProcessLock &) = delete;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;

    /// Backoff retries this acquisition needed (0 when it joined an existing hold).
    [[nodiscard]] int retries() const noexcept;

    std::optional<std::filesystem::path> lock_file_path() const noexcept;

    /**
     * @brief Checks that the lock file still exists and carries our token.
     * @return Empty on success, `owner_dead` if the hold is compromised,
     *         `not_connected` if this object holds nothing.
     */
    std::error_code verify() const noexcept;

    /// Gives up this object's share of the hold. Safe to call repeatedly.
    void release() noexcept;

    /// `<canonical target>.lock`
    static std::filesystem::path lock_file_for(const std::filesystem::path &target);

    /**
     * @brief Lifecycle module "fspec::utils::InterProcessLock"; depends on the Logger
     *        and LockConfig modules and runs the keeper thread.
     */
    static ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

  private:
    InterProcessLock() noexcept;

    struct InterProcessLockImplDeleter
    {
        void operator()(InterProcessLockImpl *p) const noexcept;
    };
    std::unique_ptr<InterProcessLockImpl, InterProcessLockImplDeleter> pImpl;
};

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
