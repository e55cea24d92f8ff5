/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-queue design**
 * 1.  Calls from application threads (`LOGGER_INFO(...)`) format the message on
 *     the caller's thread and push it onto a bounded queue. They never touch a file.
 * 2.  One worker thread is the only consumer of the queue. It owns the active
 *     sink and performs all I/O, so sink switches and writes never race.
 * 3.  Configuration calls (`set_logfile`, `set_level`, `flush`) are commands on
 *     the same queue and take effect in the order they were issued.
 * 4.  When the queue is full, log records are dropped and counted; the worker
 *     writes one warning with the count once it catches up. Commands are never
 *     dropped.
 * 5.  The level is checked on the caller's thread, before formatting.
 *
 * The logger is a lifecycle module. Any API call before
 * `Logger::GetLifecycleModule()` has been started panics.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Loaded {} entries from '{}'", count, path.string());
 *
 * auto &logger = fspec::utils::Logger::instance();
 * logger.set_logfile("/var/log/fspec.log", true);
 * logger.set_level(fspec::utils::Logger::Level::L_DEBUG);
 * logger.flush();
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "fspec_utils_export.h"
#include "utils/module_def.hpp"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace fspec::utils
{

class FSPEC_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /**
     * @brief Lifecycle module "fspec::utils::Logger" (starts the worker thread;
     *        shutdown drains the queue, bounded by 5s).
     */
    static ModuleDef GetLifecycleModule();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Each call blocks until the worker has processed the switch.

    /**
     * @brief Switches logging to the console (stderr).
     * @return true if the worker installed the sink.
     */
    bool set_console();

    /**
     * @brief Switches logging to a file, appending to it.
     * @param utf8_path Path to the log file; its parent directory must exist and be writable.
     * @param use_flock Serialize writes with an advisory lock (POSIX), for log files shared
     *                  between processes.
     * @return false if the file could not be opened; the previous sink stays active and
     *         the reason is logged as a warning through it.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = false);

    /**
     * @brief Blocks until every message queued before this call has been written.
     */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Runtime check used by the templates; false before init and after shutdown.
    bool should_log(Level lvl) const noexcept;

    /// Queues an already formatted message body. Returns false if it was dropped.
    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;

  private:
    Logger();

    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        fmt::memory_buffer mb;
        try
        {
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
        }
        catch (const std::exception &ex)
        {
            mb.clear();
            fmt::format_to(std::back_inserter(mb), "[FORMAT ERROR] {}", ex.what());
        }
        enqueue_log(lvl, std::move(mb));
    }
}

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::fspec::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::fspec::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::fspec::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::fspec::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::fspec::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::fspec::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
