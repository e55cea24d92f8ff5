/**
 * @file platform.cpp
 * @brief Cross-platform implementations of the process, host and clock helpers.
 *
 * Functions declared in `fspec::platform`. Lock files written by this library record
 * the owning PID and host name; the stale-lock logic relies on get_hostname() and
 * is_process_alive() being consistent across processes on the same machine.
 */
#include "fsp_base.hpp"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#if defined(FSPEC_IS_POSIX)
#include <cerrno>
#include <climits>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(FSPEC_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#endif

#if defined(FSPEC_PLATFORM_APPLE)
#include <libproc.h>
#include <mach-o/dyld.h>
#endif

#include <fmt/format.h>

namespace fspec::platform
{

uint64_t get_pid() noexcept
{
#if defined(FSPEC_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most direct OS API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(FSPEC_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(FSPEC_PLATFORM_APPLE)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(FSPEC_PLATFORM_LINUX)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(FSPEC_PLATFORM_WIN64)
        std::vector<wchar_t> buf(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = fspec::format_tools::ws2s(std::wstring(buf.data(), len));
#elif defined(FSPEC_PLATFORM_LINUX)
        std::vector<char> buf(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));
#elif defined(FSPEC_PLATFORM_APPLE)
        char procbuf[PROC_PIDPATHINFO_MAXSIZE];
        if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) <= 0)
        {
            return "unknown_macos";
        }
        full_path = procbuf;
#elif defined(FSPEC_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size = 0;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif
        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

std::string get_hostname() noexcept
{
    try
    {
#if defined(FSPEC_PLATFORM_WIN64)
        wchar_t buf[MAX_COMPUTERNAME_LENGTH + 1];
        DWORD size = MAX_COMPUTERNAME_LENGTH + 1;
        if (GetComputerNameW(buf, &size))
        {
            return fspec::format_tools::ws2s(std::wstring(buf, size));
        }
#elif defined(FSPEC_IS_POSIX)
        char buf[256] = {};
        if (gethostname(buf, sizeof(buf) - 1) == 0)
        {
            return std::string(buf);
        }
#endif
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_hostname failed: {}.\n", e.what());
    }
    return "unknown-host";
}

/**
 * @brief Checks if a process with the given PID is currently alive.
 *
 * @note POSIX: `kill(pid, 0)`; ESRCH means the process is gone, EPERM means it exists
 *       but belongs to another user.
 * @note Windows: OpenProcess() + GetExitCodeProcess() == STILL_ACTIVE.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }
#if defined(FSPEC_PLATFORM_WIN64)
    HANDLE process =
        OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }
    DWORD exit_code = 0;
    const BOOL ok = GetExitCodeProcess(process, &exit_code);
    CloseHandle(process);
    return ok && exit_code == STILL_ACTIVE;
#else
    // Larger values would turn negative and address process groups.
    if (pid > static_cast<uint64_t>(INT_MAX))
    {
        return false;
    }
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno != ESRCH;
#endif
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    const uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

} // namespace fspec::platform
