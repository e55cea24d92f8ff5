// Tools for formatting and parsing strings
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "fspec_utils_export.h"

namespace fspec::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
FSPEC_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Removes leading and trailing whitespace (" \t\n\r\f\v").
 */
FSPEC_UTILS_EXPORT std::string_view trim_whitespace(std::string_view str) noexcept;

/**
 * @brief Interprets an environment-style flag value.
 *
 * A value is truthy when, after trimming, it is non-empty and not one of
 * `0`, `false`, `no`, `off` (compared case-insensitively).
 *
 * @param value The raw value; `nullptr` (variable unset) is falsy.
 */
FSPEC_UTILS_EXPORT bool is_truthy(const char *value) noexcept;

/**
 * @brief Parses a non-negative decimal integer.
 * @return The value, or std::nullopt if @p text is empty, has trailing garbage or overflows.
 */
FSPEC_UTILS_EXPORT std::optional<uint64_t> parse_uint(std::string_view text) noexcept;

/**
 * @brief Converts a path to its Windows long path representation (e.g., `\\?\C:\...`).
 * @param path The path to convert.
 * @return The long path as a wstring. Returns an empty string on non-Windows platforms.
 */
FSPEC_UTILS_EXPORT std::wstring win32_to_long_path(const std::filesystem::path &);
/**
 * @brief Converts a UTF-8 encoded std::string to a std::wstring on Windows.
 * @return The converted wstring. Returns an empty string on non-Windows platforms.
 */
FSPEC_UTILS_EXPORT std::wstring s2ws(const std::string &s);
/**
 * @brief Converts a std::wstring to a UTF-8 encoded std::string on Windows.
 * @return The converted string. Returns an empty string on non-Windows platforms.
 */
FSPEC_UTILS_EXPORT std::string ws2s(const std::wstring &w);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Creates a `fmt::memory_buffer` from a runtime format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer_rt(fmt::string_view fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 * @param file_path A string_view of the full path.
 * @return A string_view of just the filename portion of the path.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    if (pos == std::string_view::npos)
    {
        return file_path;
    }
    return file_path.substr(pos + 1);
}

} // namespace fspec::format_tools
