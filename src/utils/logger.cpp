/*******************************************************************************
 * @file logger.cpp
 * @brief Asynchronous logger: callers queue records, one worker owns the sink.
 ******************************************************************************/

#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "fsp_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <fmt/format.h>

using namespace fspec::format_tools;

namespace fspec::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Panics if the module was never started; false once shutdown has begun.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        FSP_PANIC("Logger method '{}' was called before the Logger module was "
                  "initialized via LifecycleManager. Aborting.",
                  function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{
struct SinkSwitch
{
    std::unique_ptr<Sink> sink;
    std::promise<bool> done;
};

struct FlushBarrier
{
    std::promise<void> done;
};

using Command = std::variant<LogMessage, SinkSwitch, FlushBarrier>;

LogMessage make_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = fspec::platform::get_pid(),
                      .thread_id = fspec::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

// A failing sink must not take the worker down; the failure goes to stderr instead.
template <typename Fn> void guarded(const char *what, Fn &&fn) noexcept
{
    try
    {
        fn();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[fspec] Logger {} failed: {}\n", what, e.what());
    }
}
} // namespace

struct Logger::Impl
{
    static constexpr size_t kQueueLimit = 10000;

    ~Impl() { stop(); }

    void start();
    void stop();
    bool push(Command &&cmd);
    void run();
    void apply(Command &cmd);
    void note(Logger::Level lvl, fmt::memory_buffer &&body);
    bool switch_to(std::unique_ptr<Sink> next);

    std::atomic<Logger::Level> level{Logger::Level::L_INFO};

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<Command> pending; // guarded by mtx
    size_t dropped = 0;           // guarded by mtx
    bool stopping = false;        // guarded by mtx

    // Owned by the worker once it runs.
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::thread worker;
};

void Logger::Impl::start()
{
    if (!worker.joinable())
    {
        worker = std::thread(&Logger::Impl::run, this);
    }
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lk(mtx);
        stopping = true;
    }
    cv.notify_one();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
    {
        worker.join();
    }
}

// Only log records are subject to the queue limit; a command always gets through.
bool Logger::Impl::push(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lk(mtx);
        if (stopping)
        {
            return false;
        }
        if (std::holds_alternative<LogMessage>(cmd) && pending.size() >= kQueueLimit)
        {
            ++dropped;
            return false;
        }
        pending.push_back(std::move(cmd));
    }
    cv.notify_one();
    return true;
}

void Logger::Impl::note(Logger::Level lvl, fmt::memory_buffer &&body)
{
    sink->write(make_record(lvl, std::move(body)), Sink::ASYNC_WRITE);
}

void Logger::Impl::apply(Command &cmd)
{
    if (auto *rec = std::get_if<LogMessage>(&cmd))
    {
        guarded("write", [&] { sink->write(*rec, Sink::ASYNC_WRITE); });
    }
    else if (auto *sw = std::get_if<SinkSwitch>(&cmd))
    {
        const std::string from = sink->description();
        guarded("sink switch",
                [&]
                {
                    note(Logger::Level::L_SYSTEM,
                         make_buffer("Switching log sink to: {}", sw->sink->description()));
                    sink->flush();
                });
        sink = std::move(sw->sink);
        guarded("sink switch", [&]
                { note(Logger::Level::L_SYSTEM, make_buffer("Log sink switched from: {}", from)); });
        sw->done.set_value(true);
    }
    else if (auto *fb = std::get_if<FlushBarrier>(&cmd))
    {
        guarded("flush", [&] { sink->flush(); });
        fb->done.set_value();
    }
}

void Logger::Impl::run()
{
    std::vector<Command> batch;
    for (;;)
    {
        size_t lost = 0;
        bool last_round = false;
        {
            std::unique_lock<std::mutex> lk(mtx);
            cv.wait(lk, [this] { return stopping || !pending.empty(); });
            batch.swap(pending);
            lost = std::exchange(dropped, 0);
            last_round = stopping && batch.empty();
        }

        if (lost > 0)
        {
            guarded("overflow report",
                    [&]
                    {
                        note(Logger::Level::L_WARNING,
                             make_buffer("Logger queue was full; {} messages were dropped.",
                                         lost));
                    });
        }
        for (auto &cmd : batch)
        {
            apply(cmd);
        }
        batch.clear();

        if (last_round)
        {
            break;
        }
    }

    guarded("final message",
            [&]
            {
                note(Logger::Level::L_SYSTEM, make_buffer("Logger is shutting down."));
                sink->flush();
            });
}

bool Logger::Impl::switch_to(std::unique_ptr<Sink> next)
{
    SinkSwitch sw{std::move(next), {}};
    auto done = sw.done.get_future();
    if (!push(Command{std::move(sw)}))
    {
        return false;
    }
    return done.get();
}

// --- Public API ---

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    return pImpl->switch_to(std::make_unique<ConsoleSink>());
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    std::unique_ptr<Sink> file;
    try
    {
        file = std::make_unique<FileSink>(utf8_path, use_flock);
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("Logger: keeping the current sink: {}", e.what());
        return false;
    }
    return pImpl->switch_to(std::move(file));
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    FlushBarrier fb;
    auto done = fb.done.get_future();
    if (pImpl->push(Command{std::move(fb)}))
    {
        done.get();
    }
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    try
    {
        return pImpl->push(make_record(lvl, std::move(body)));
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[fspec] Logger failed to queue a message: {}\n", e.what());
    }
    return false;
}

// --- Lifecycle callbacks ---

void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

// Drains everything queued so far, then stops the worker.
void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().pImpl->stop();
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("fspec::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace fspec::utils
