// format_tools.cpp
#include "fsp_base.hpp"

#include <cctype>
#include <charconv>

namespace fspec::format_tools
{

// fmt's chrono formatter only prints whole seconds for a seconds-precision time_point,
// so the microsecond fraction is appended in a second step.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim_whitespace(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";

    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

bool is_truthy(const char *value) noexcept
{
    if (value == nullptr)
    {
        return false;
    }
    const std::string_view v = trim_whitespace(value);
    if (v.empty())
    {
        return false;
    }
    auto iequals = [v](std::string_view word)
    {
        if (word.size() != v.size())
            return false;
        for (size_t i = 0; i < v.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(v[i])) != word[i])
                return false;
        }
        return true;
    };
    return !(iequals("0") || iequals("false") || iequals("no") || iequals("off"));
}

std::optional<uint64_t> parse_uint(std::string_view text) noexcept
{
    text = trim_whitespace(text);
    if (text.empty())
    {
        return std::nullopt;
    }
    uint64_t value = 0;
    const auto *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

#if defined(FSPEC_PLATFORM_WIN64)

/// Convert a path to Win32 long-path form with \\?\ or \\?\UNC\ prefix.
/// Returns an empty wstring if the path cannot be made absolute.
std::wstring win32_to_long_path(const std::filesystem::path &p_in)
{
    std::error_code ec;
    std::filesystem::path abs = p_in;
    if (!abs.is_absolute())
    {
        abs = std::filesystem::absolute(abs, ec);
        if (ec)
        {
            return std::wstring{};
        }
    }
    std::wstring ws = abs.wstring();
    for (auto &c : ws)
        if (c == L'/')
            c = L'\\';

    if (ws.rfind(L"\\\\?\\", 0) == 0)
    {
        return ws;
    }
    if (ws.rfind(L"\\\\", 0) == 0)
    {
        return std::wstring(L"\\\\?\\UNC\\") + ws.substr(2);
    }
    return std::wstring(L"\\\\?\\") + ws;
}

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};
    int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                       static_cast<int>(s.size()), nullptr, 0);
    if (required <= 0)
        return {};
    std::wstring w(required, L'\0');
    if (MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()),
                            w.data(), required) == 0)
        return {};
    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};
    int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(),
                                       static_cast<int>(w.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
        return {};
    std::string s(required, '\0');
    if (WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr) == 0)
        return {};
    return s;
}

#else

// POSIX stubs (not used on POSIX)
std::wstring win32_to_long_path([[maybe_unused]] const std::filesystem::path &path)
{
    return {};
}

std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

} // namespace fspec::format_tools
