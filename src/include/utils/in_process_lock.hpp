#pragma once
/**
 * @file in_process_lock.hpp
 * @brief Per-path readers-writer lock shared by the threads of one process.
 *
 * An `InProcessLockRegistry` maps a canonical absolute path to a lock state
 * (reader count, writer flag, FIFO queues of waiting readers and writers). One
 * registry is created by the application and passed by reference to every
 * LockedFileManager that should coordinate with the others.
 *
 * Wake-up policy:
 * - `acquire_read` succeeds at once unless a writer holds the path. Queued
 *   writers do not hold readers back.
 * - `release_read` wakes one queued writer when the last reader leaves.
 * - `acquire_write` waits until there is no reader and no writer, re-checking
 *   after every wake-up.
 * - `release_write` hands the path to every queued reader at once; only when no
 *   reader is queued does it wake the next writer.
 *
 * Readers are favoured: a steady stream of overlapping readers can keep a
 * writer waiting indefinitely. That is accepted for read-heavy state files.
 *
 * Paths never interact: operations on A do not block operations on B.
 */
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "fspec_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace fspec::utils
{

/**
 * @brief Key used for @p path by the lock registry and the lock-file layer:
 *        `weakly_canonical(absolute(path))` as a generic string.
 */
FSPEC_UTILS_EXPORT std::string canonical_lock_key(const std::filesystem::path &path);

class FSPEC_UTILS_EXPORT InProcessLockRegistry
{
  public:
    /// Point-in-time view of one path's lock state.
    struct Snapshot
    {
        std::size_t reader_count = 0;
        bool writer_held = false;
        std::size_t waiting_readers = 0;
        std::size_t waiting_writers = 0;
    };

    InProcessLockRegistry();
    ~InProcessLockRegistry();

    InProcessLockRegistry(const InProcessLockRegistry &) = delete;
    InProcessLockRegistry &operator=(const InProcessLockRegistry &) = delete;

    void acquire_read(const std::filesystem::path &path);
    /// Panics if @p path has no reader.
    void release_read(const std::filesystem::path &path);

    void acquire_write(const std::filesystem::path &path);
    /// Panics if @p path has no writer.
    void release_write(const std::filesystem::path &path);

    Snapshot snapshot(const std::filesystem::path &path) const;

    /// Forgets every path. Panics if any path is held or waited on.
    void reset();

    /// Number of paths with a lock state.
    std::size_t size() const;

    class ReadGuard;
    class WriteGuard;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/// Holds a read lock for its lifetime.
class FSPEC_UTILS_EXPORT InProcessLockRegistry::ReadGuard
{
  public:
    ReadGuard(InProcessLockRegistry &registry, std::filesystem::path path);
    ~ReadGuard();

    ReadGuard(const ReadGuard &) = delete;
    ReadGuard &operator=(const ReadGuard &) = delete;

  private:
    InProcessLockRegistry &m_registry;
    std::filesystem::path m_path;
};

/// Holds the write lock for its lifetime.
class FSPEC_UTILS_EXPORT InProcessLockRegistry::WriteGuard
{
  public:
    WriteGuard(InProcessLockRegistry &registry, std::filesystem::path path);
    ~WriteGuard();

    WriteGuard(const WriteGuard &) = delete;
    WriteGuard &operator=(const WriteGuard &) = delete;

  private:
    InProcessLockRegistry &m_registry;
    std::filesystem::path m_path;
};

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
