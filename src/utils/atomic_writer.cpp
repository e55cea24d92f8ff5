// atomic_writer.cpp
#include "fsp_service.hpp"
#include "utils/atomic_writer.hpp"

#include <cstring>
#include <optional>
#include <thread>

#if defined(FSPEC_IS_POSIX)
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace fspec::utils
{

fs::path make_temp_path(const fs::path &target)
{
    fs::path tmp = target;
    tmp += ".tmp.";
    tmp += fspec::uid::generate_temp_suffix();
    return tmp;
}

namespace
{
constexpr int kRenameRetries = 5;
constexpr std::chrono::milliseconds kRenameDelay{100};

/**
 * Creates the parent directory of target if needed. On failure sets ec, logs, returns false.
 */
bool ensure_parent_dir(const fs::path &target, std::error_code &ec)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
    {
        return true;
    }
    std::error_code create_ec;
    fs::create_directories(parent, create_ec);
    if (create_ec)
    {
        ec = create_ec;
        LOGGER_ERROR("atomic_write_file: create_directories failed for '{}': {}", parent.string(),
                     create_ec.message());
        return false;
    }
    return true;
}

#if defined(FSPEC_PLATFORM_WIN64)

/**
 * Creates the temp file with CREATE_NEW, writes content, flushes and closes it.
 * On failure the temp file is deleted, ec is set and false is returned.
 */
bool write_temp_win(const fs::path &tmp, std::string_view content, std::error_code &ec)
{
    const std::wstring tmp_w = fspec::format_tools::win32_to_long_path(tmp);
    HANDLE h = CreateFileW(tmp_w.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        const DWORD err = GetLastError();
        ec = std::error_code(static_cast<int>(err), std::system_category());
        LOGGER_ERROR("atomic_write_file: CreateFileW(temp) failed for '{}'. Error:{}",
                     tmp.string(), err);
        return false;
    }

    DWORD written = 0;
    const BOOL ok =
        WriteFile(h, content.data(), static_cast<DWORD>(content.size()), &written, nullptr);
    if (!ok || written != static_cast<DWORD>(content.size()) || FlushFileBuffers(h) == 0)
    {
        const DWORD err = GetLastError();
        CloseHandle(h);
        DeleteFileW(tmp_w.c_str());
        ec = std::error_code(static_cast<int>(err), std::system_category());
        LOGGER_ERROR("atomic_write_file: writing temp file '{}' failed. Error:{}", tmp.string(),
                     err);
        return false;
    }
    CloseHandle(h);
    return true;
}

/**
 * ReplaceFileW over an existing target, MoveFileExW when the target does not exist yet.
 * Sharing violations are retried. On failure the temp file is deleted.
 */
bool replace_win(const fs::path &tmp, const fs::path &target, std::error_code &ec)
{
    const std::wstring tmp_w = fspec::format_tools::win32_to_long_path(tmp);
    const std::wstring target_w = fspec::format_tools::win32_to_long_path(target);
    DWORD last_error = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (ReplaceFileW(target_w.c_str(), tmp_w.c_str(), nullptr, REPLACEFILE_WRITE_THROUGH,
                         nullptr, nullptr) != 0)
        {
            return true;
        }
        last_error = GetLastError();
        if (last_error == ERROR_FILE_NOT_FOUND)
        {
            if (MoveFileExW(tmp_w.c_str(), target_w.c_str(),
                            MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0)
            {
                return true;
            }
            last_error = GetLastError();
            break;
        }
        if (last_error != ERROR_SHARING_VIOLATION)
        {
            break;
        }
        LOGGER_WARN("atomic_write_file: sharing violation replacing '{}', retrying...",
                    target.string());
        std::this_thread::sleep_for(kRenameDelay);
    }
    DeleteFileW(tmp_w.c_str());
    ec = std::error_code(static_cast<int>(last_error), std::system_category());
    LOGGER_ERROR("atomic_write_file: replacing '{}' failed. Error:{}", target.string(),
                 last_error);
    return false;
}

#else

/**
 * Refuses to replace a symbolic link. lstat failure (target missing) is allowed.
 */
bool reject_if_symlink(const fs::path &target, std::error_code &ec)
{
    struct stat lstat_buf;
    if (::lstat(target.c_str(), &lstat_buf) != 0 || !S_ISLNK(lstat_buf.st_mode))
    {
        return true;
    }
    ec = std::make_error_code(std::errc::operation_not_permitted);
    LOGGER_ERROR("atomic_write_file: target '{}' is a symbolic link, refusing to write",
                 target.string());
    return false;
}

/**
 * Fails the write: closes fd (if open), unlinks the temp file, records errnum.
 */
bool fail_temp(int fd, const fs::path &tmp, int errnum, const char *what, std::error_code &ec)
{
    if (fd != -1)
    {
        ::close(fd);
    }
    if (::unlink(tmp.c_str()) != 0 && errno != ENOENT)
    {
        LOGGER_WARN("atomic_write_file: could not remove temp file '{}': {}", tmp.string(),
                    std::strerror(errno));
    }
    ec = std::error_code(errnum, std::generic_category());
    LOGGER_ERROR("atomic_write_file: {} failed for '{}'. Error: {}", what, tmp.string(),
                 std::strerror(errnum));
    return false;
}

/**
 * Creates the temp file exclusively, writes all of content, fsyncs, matches the target's
 * permission bits when the target exists, then closes.
 */
bool write_temp_posix(const fs::path &tmp, const fs::path &target, std::string_view content,
                      std::error_code &ec)
{
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0644);
    if (fd == -1)
    {
        const int errnum = errno;
        ec = std::error_code(errnum, std::generic_category());
        LOGGER_ERROR("atomic_write_file: creating temp file '{}' failed. Error: {}", tmp.string(),
                     std::strerror(errnum));
        return false;
    }

    size_t written = 0;
    while (written < content.size())
    {
        const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return fail_temp(fd, tmp, errno, "write", ec);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0)
    {
        return fail_temp(fd, tmp, errno, "fsync(file)", ec);
    }

    struct stat stat_buf;
    if (::stat(target.c_str(), &stat_buf) == 0 && ::fchmod(fd, stat_buf.st_mode & 07777) != 0)
    {
        return fail_temp(fd, tmp, errno, "fchmod", ec);
    }

    if (::close(fd) != 0)
    {
        return fail_temp(-1, tmp, errno, "close", ec);
    }
    return true;
}

/**
 * rename(2) with retries on EBUSY, ETXTBSY and EINTR. On failure unlinks the temp file.
 */
bool rename_posix(const fs::path &tmp, const fs::path &target, std::error_code &ec)
{
    const fspec::utils::ConstantBackoff backoff(kRenameDelay);
    int last_errnum = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (::rename(tmp.c_str(), target.c_str()) == 0)
        {
            return true;
        }
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
        {
            break;
        }
        LOGGER_WARN("atomic_write_file: rename hit transient error {} for '{}', retrying...",
                    std::strerror(last_errnum), target.string());
        backoff(i);
    }
    return fail_temp(-1, tmp, last_errnum, "rename", ec);
}

// The rename is already visible; a failed directory fsync only weakens crash durability.
void fsync_parent_dir(const fs::path &target)
{
    fs::path parent = target.parent_path();
    if (parent.empty())
    {
        parent = ".";
    }
    const int dir_fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd == -1)
    {
        LOGGER_WARN("atomic_write_file: cannot open directory '{}' for fsync: {}",
                    parent.string(), std::strerror(errno));
        return;
    }
    if (::fsync(dir_fd) != 0)
    {
        LOGGER_WARN("atomic_write_file: fsync(dir) failed for '{}': {}", parent.string(),
                    std::strerror(errno));
    }
    ::close(dir_fd);
}

#endif
} // namespace

void atomic_write_file(const fs::path &target, std::string_view content,
                       std::error_code &ec) noexcept
{
    ec.clear();
    try
    {
        if (target.empty() || !target.has_filename())
        {
            ec = std::make_error_code(std::errc::invalid_argument);
            LOGGER_ERROR("atomic_write_file: invalid target path '{}'", target.string());
            return;
        }
        if (!ensure_parent_dir(target, ec))
        {
            return;
        }

        const fs::path tmp = make_temp_path(target);
#if defined(FSPEC_PLATFORM_WIN64)
        if (!write_temp_win(tmp, content, ec))
        {
            return;
        }
        replace_win(tmp, target, ec);
#else
        if (!reject_if_symlink(target, ec))
        {
            return;
        }
        if (!write_temp_posix(tmp, target, content, ec))
        {
            return;
        }
        if (!rename_posix(tmp, target, ec))
        {
            return;
        }
        fsync_parent_dir(target);
#endif
    }
    catch (const std::exception &ex)
    {
        ec = std::make_error_code(std::errc::io_error);
        LOGGER_ERROR("atomic_write_file: exception while writing '{}': {}", target.string(),
                     ex.what());
    }
}

} // namespace fspec::utils
