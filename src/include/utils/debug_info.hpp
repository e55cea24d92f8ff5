/**
 * @file debug_info.hpp
 * @brief Stack trace printing, panic handling for fatal errors, and debug messages.
 *
 * Functions live in `fspec::debug`. Format strings are checked at compile time through
 * `fmt::format_string`; `std::source_location` supplies the call site.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "fspec_utils_export.h"
#include "utils/format_tools.hpp"

/**
 * @brief Renders a source location as "file:line:function".
 */
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", fspec::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace fspec::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * On Windows, uses `CaptureStackBackTrace` with DbgHelp symbol lookup. On POSIX, uses
 * `backtrace` with `dladdr` and `__cxa_demangle`. Failures are reported on `stderr`.
 */
FSPEC_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Halts the program with a fatal error message and a stack trace.
 *
 * Use for unrecoverable programming errors (an API used before its lifecycle module
 * started, an unlock without a matching lock). Prints the message with the call site,
 * prints the stack, then calls `std::abort()`.
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc), body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] FATAL ERROR WHILE FORMATTING PANIC MESSAGE: %s\n",
                     e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/**
 * @brief Prints a debug message to `stderr`.
 */
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        const auto body = fmt::format(fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "[DBG]  {}\n", body);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  FORMAT ERROR DURING DEBUG_MSG: %s\n", e.what());
    }
}

} // namespace fspec::debug

#ifndef FSP_LOC_HERE_STR
#define FSP_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Calls `fspec::debug::panic` with the current source location.
 */
#ifndef FSP_PANIC
#define FSP_PANIC(fmt, ...)                                                                        \
    ::fspec::debug::panic(std::source_location::current(),                                        \
                          FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

/**
 * @brief Prints a debug message when FSPEC_ENABLE_DEBUG_MESSAGES is defined; no-op otherwise.
 */
#ifndef FSP_DEBUG
#if defined(FSPEC_ENABLE_DEBUG_MESSAGES)
#define FSP_DEBUG(fmt, ...) ::fspec::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define FSP_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
