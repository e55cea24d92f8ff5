#pragma once
/**
 * @file fsp_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (FSPEC_PLATFORM_WIN64, FSPEC_IS_POSIX, etc.) or Windows
 * headers should include this. It also declares the process and clock helpers the
 * lock layer uses to identify lock owners and measure wait times.
 *
 * Detection relies on compiler predefined macros only.
 */
#include <cstddef>
#include <cstdint>
#include <string>

#if defined(_WIN64)
#define FSPEC_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__) && defined(__MACH__)
#define FSPEC_PLATFORM_APPLE 1
#elif defined(__FreeBSD__)
#define FSPEC_PLATFORM_FREEBSD 1
#elif defined(__linux__)
#define FSPEC_PLATFORM_LINUX 1
#else
#define FSPEC_PLATFORM_UNKNOWN 1
#endif

// Convenience booleans for source code usage:
#if defined(FSPEC_PLATFORM_WIN64)
#define FSPEC_IS_WINDOWS 1
#undef FSPEC_IS_POSIX
#elif defined(FSPEC_PLATFORM_APPLE) || defined(FSPEC_PLATFORM_FREEBSD) ||                    \
    defined(FSPEC_PLATFORM_LINUX)
#undef FSPEC_IS_WINDOWS
#define FSPEC_IS_POSIX 1
#else
#undef FSPEC_IS_WINDOWS
#undef FSPEC_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// The codebase uses concepts, std::source_location and designated initializers.
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).

#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "fspec_utils_export.h"

namespace fspec::platform
{

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
FSPEC_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
FSPEC_UTILS_EXPORT uint64_t get_pid() noexcept;
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
FSPEC_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/**
 * @brief Gets the network host name of this machine.
 * @details Lock files record the host so that a PID is only interpreted on the machine
 *          that wrote it.
 * @return The host name, or "unknown-host" when it cannot be determined.
 */
FSPEC_UTILS_EXPORT std::string get_hostname() noexcept;

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Uses platform-specific APIs:
 *          - Windows: OpenProcess() + GetExitCodeProcess()
 *          - POSIX: kill(pid, 0) with errno check
 * @param pid The process ID to check.
 * @return True if the process is alive, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note On POSIX, EPERM (permission denied) is treated as "alive".
 */
FSPEC_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @return Monotonic timestamp in nanoseconds since an unspecified epoch.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
FSPEC_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns.
 * @note If start_ns is in the future (clock skew), returns 0.
 */
FSPEC_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

/// Milliseconds elapsed since a monotonic_time_ns() timestamp.
inline uint64_t elapsed_time_ms(uint64_t start_ns) noexcept
{
    return elapsed_time_ns(start_ns) / 1'000'000ULL;
}

} // namespace fspec::platform
