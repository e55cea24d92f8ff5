// inter_process_lock.cpp
#include "fsp_service.hpp"
#include "utils/in_process_lock.hpp"
#include "utils/inter_process_lock.hpp"

#include <condition_variable>
#include <fstream>
#include <iterator>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#if defined(FSPEC_IS_POSIX)
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;
using namespace fspec::platform;

static std::atomic<bool> g_ipl_initialized{false};

namespace fspec::utils
{

namespace
{
constexpr std::chrono::milliseconds kInterProcessLockShutdownTimeoutMs{2000};
constexpr std::chrono::milliseconds kKeeperTick{250};

// One process-wide hold on a lock file, shared by every thread that joined it.
struct HoldState
{
    int holders = 0;
    int waiters = 0;
    bool acquiring = false;
    bool compromised = false;
    std::string token;
    fs::path lock_path;
    std::chrono::milliseconds update{5000};
    std::chrono::steady_clock::time_point last_touch;
    std::condition_variable cv;
};

std::mutex g_holds_mtx;
std::unordered_map<std::string, std::shared_ptr<HoldState>> g_holds;

std::condition_variable g_keeper_cv;
bool g_keeper_stop = false;
std::thread g_keeper_thread;

struct LockFileInfo
{
    bool exists = false;
    bool parsed = false;
    uint64_t pid = 0;
    std::string host;
    std::string token;
};

struct FileStamp
{
    bool exists = false;
    bool has_mtime = false;
    uint64_t inode = 0;
    fs::file_time_type mtime{};
};

const std::string &this_host()
{
    static const std::string host = get_hostname();
    return host;
}

LockFileInfo read_lock_file(const fs::path &lock_path) noexcept
{
    LockFileInfo info;
    try
    {
        std::ifstream in(lock_path, std::ios::binary);
        if (!in)
        {
            return info;
        }
        info.exists = true;
        const std::string content{std::istreambuf_iterator<char>(in),
                                  std::istreambuf_iterator<char>()};
        const auto doc = nlohmann::json::parse(content, nullptr, false);
        if (doc.is_discarded() || !doc.is_object())
        {
            return info;
        }
        info.pid = doc.value("pid", uint64_t{0});
        info.host = doc.value("host", std::string());
        info.token = doc.value("token", std::string());
        info.parsed = !info.token.empty();
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("InterProcessLock: cannot read lock file '{}': {}", lock_path.string(),
                    e.what());
    }
    return info;
}

// Describes the directory entry itself; a symlink is not followed.
FileStamp stamp_of(const fs::path &lock_path) noexcept
{
    FileStamp stamp;
    std::error_code ec;
    const auto status = fs::symlink_status(lock_path, ec);
    if (ec || !fs::exists(status))
    {
        return stamp;
    }
    stamp.exists = true;
    stamp.mtime = fs::last_write_time(lock_path, ec);
    stamp.has_mtime = !ec;
#if defined(FSPEC_IS_POSIX)
    struct stat st;
    if (::lstat(lock_path.c_str(), &st) == 0)
    {
        stamp.inode = static_cast<uint64_t>(st.st_ino);
    }
#endif
    return stamp;
}

/**
 * Creates the lock file exclusively and writes @p content into it.
 * Returns `file_exists` when another owner holds it; a half-written file is removed.
 */
std::error_code create_lock_file(const fs::path &lock_path, const std::string &content) noexcept
{
#if defined(FSPEC_PLATFORM_WIN64)
    const std::wstring wpath = fspec::format_tools::win32_to_long_path(lock_path);
    HANDLE h = CreateFileW(wpath.c_str(), GENERIC_WRITE, FILE_SHARE_READ | FILE_SHARE_DELETE,
                           nullptr, CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        const DWORD err = GetLastError();
        if (err == ERROR_FILE_EXISTS || err == ERROR_ALREADY_EXISTS)
        {
            return std::make_error_code(std::errc::file_exists);
        }
        if (err == ERROR_PATH_NOT_FOUND)
        {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return std::error_code(static_cast<int>(err), std::system_category());
    }
    DWORD written = 0;
    const BOOL ok =
        WriteFile(h, content.data(), static_cast<DWORD>(content.size()), &written, nullptr);
    const DWORD err = GetLastError();
    CloseHandle(h);
    if (!ok || written != static_cast<DWORD>(content.size()))
    {
        DeleteFileW(wpath.c_str());
        return std::error_code(static_cast<int>(err), std::system_category());
    }
    return {};
#else
    const int fd = ::open(lock_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW,
                          0644);
    if (fd == -1)
    {
        return std::error_code(errno, std::generic_category());
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
            const int errnum = errno;
            ::close(fd);
            ::unlink(lock_path.c_str());
            return std::error_code(errnum, std::generic_category());
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0)
    {
        const int errnum = errno;
        ::unlink(lock_path.c_str());
        return std::error_code(errnum, std::generic_category());
    }
    return {};
#endif
}

/**
 * Removes the lock file at @p lock_path if it is stale and unchanged since it was
 * examined. Returns true when the caller should retry creation immediately.
 */
bool reclaim_if_stale(const fs::path &lock_path, const LockConfig &config) noexcept
{
    const FileStamp before = stamp_of(lock_path);
    if (!before.exists)
    {
        return true;
    }
    // An entry we cannot open is judged by age alone, like one we cannot parse.
    const LockFileInfo owner = read_lock_file(lock_path);
    if (!owner.exists && !stamp_of(lock_path).exists)
    {
        return true;
    }

    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        fs::file_time_type::clock::now() - before.mtime);

    std::string reason;
    if (before.has_mtime && age > config.stale)
    {
        reason = fmt::format("not refreshed for {}ms", age.count());
    }
    else if (owner.parsed && owner.host == this_host() &&
             (owner.pid == get_pid() || !is_process_alive(owner.pid)))
    {
        // Our own PID here means a leftover: a live hold of ours would have been joined.
        reason = fmt::format("owner process {} is gone", owner.pid);
    }
    else
    {
        return false;
    }

    const FileStamp now = stamp_of(lock_path);
    if (!now.exists)
    {
        return true;
    }
    if (now.inode != before.inode || now.has_mtime != before.has_mtime ||
        now.mtime != before.mtime)
    {
        return false;
    }

    std::error_code ec;
    fs::remove(lock_path, ec);
    if (ec)
    {
        LOGGER_WARN("InterProcessLock: cannot remove stale lock file '{}': {}",
                    lock_path.string(), ec.message());
        return false;
    }
    LOGGER_WARN("InterProcessLock: reclaimed stale lock file '{}' (pid {} on '{}', {})",
                lock_path.string(), owner.pid, owner.host, reason);
    return true;
}

/**
 * Creates the lock file, reclaiming stale ones and backing off between attempts.
 */
std::error_code os_acquire(const fs::path &lock_path, const std::string &content,
                           const LockConfig &config, int &retries) noexcept
{
    const auto backoff = config.backoff();
    bool parent_created = false;
    int attempt = 0;
    try
    {
        for (;;)
        {
            const std::error_code ec = create_lock_file(lock_path, content);
            if (!ec)
            {
                return {};
            }
            if (ec == std::errc::no_such_file_or_directory && !parent_created)
            {
                std::error_code dir_ec;
                fs::create_directories(lock_path.parent_path(), dir_ec);
                parent_created = true;
                if (dir_ec)
                {
                    LOGGER_ERROR("InterProcessLock: cannot create directory '{}': {}",
                                 lock_path.parent_path().string(), dir_ec.message());
                    return dir_ec;
                }
                continue;
            }
            if (ec != std::errc::file_exists)
            {
                LOGGER_ERROR("InterProcessLock: cannot create lock file '{}': {}",
                             lock_path.string(), ec.message());
                return ec;
            }
            if (reclaim_if_stale(lock_path, config))
            {
                continue;
            }
            if (attempt >= config.retries)
            {
                return std::make_error_code(std::errc::timed_out);
            }
            backoff(attempt);
            retries = ++attempt;
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("InterProcessLock: acquiring '{}' failed: {}", lock_path.string(), e.what());
        return std::make_error_code(std::errc::io_error);
    }
}

// Caller holds g_holds_mtx. Marks the hold compromised when the file is gone or foreign.
bool check_ownership_locked(HoldState &hold) noexcept
{
    if (hold.compromised)
    {
        return false;
    }
    const LockFileInfo info = read_lock_file(hold.lock_path);
    if (info.exists && info.parsed && info.token == hold.token)
    {
        return true;
    }
    hold.compromised = true;
    if (!info.exists)
    {
        LOGGER_ERROR("InterProcessLock: lock file '{}' disappeared while held; lock compromised",
                     hold.lock_path.string());
    }
    else
    {
        LOGGER_ERROR("InterProcessLock: lock file '{}' now belongs to pid {} on '{}'; "
                     "lock compromised",
                     hold.lock_path.string(), info.pid, info.host);
    }
    return false;
}

// Caller holds g_holds_mtx.
void drop_hold_if_unused_locked(const std::string &key, const std::shared_ptr<HoldState> &hold)
{
    if (hold->holders == 0 && hold->waiters == 0 && !hold->acquiring)
    {
        auto it = g_holds.find(key);
        if (it != g_holds.end() && it->second == hold)
        {
            g_holds.erase(it);
        }
    }
}

void keeper_loop()
{
    std::unique_lock<std::mutex> lk(g_holds_mtx);
    while (!g_keeper_stop)
    {
        g_keeper_cv.wait_for(lk, kKeeperTick, [] { return g_keeper_stop; });
        if (g_keeper_stop)
        {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        for (auto &[key, hold] : g_holds)
        {
            if (hold->holders == 0 || hold->compromised)
            {
                continue;
            }
            if (!check_ownership_locked(*hold))
            {
                continue;
            }
            if (now - hold->last_touch >= hold->update)
            {
                std::error_code ec;
                fs::last_write_time(hold->lock_path, fs::file_time_type::clock::now(), ec);
                if (ec)
                {
                    LOGGER_WARN("InterProcessLock: cannot refresh lock file '{}': {}",
                                hold->lock_path.string(), ec.message());
                }
                hold->last_touch = now;
            }
        }
    }
}
} // namespace

struct InterProcessLockImpl
{
    std::string key;
    fs::path lock_path;
    std::shared_ptr<HoldState> hold;
    bool valid = false;
    int retries = 0;
    std::error_code ec;
};

static void acquire(InterProcessLockImpl *pImpl, const fs::path &target,
                    const LockConfig &config) noexcept
{
    try
    {
        pImpl->lock_path = InterProcessLock::lock_file_for(target);
        pImpl->key = pImpl->lock_path.generic_string();
    }
    catch (const fs::filesystem_error &e)
    {
        pImpl->ec = e.code();
        return;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("InterProcessLock: invalid target '{}': {}", target.string(), e.what());
        pImpl->ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    std::shared_ptr<HoldState> hold;
    std::string content;
    try
    {
        std::unique_lock<std::mutex> lk(g_holds_mtx);
        auto &slot = g_holds[pImpl->key];
        if (!slot)
        {
            slot = std::make_shared<HoldState>();
        }
        hold = slot;

        ++hold->waiters;
        for (;;)
        {
            if (hold->holders > 0 && !hold->compromised)
            {
                ++hold->holders;
                --hold->waiters;
                pImpl->hold = hold;
                pImpl->valid = true;
                return;
            }
            if (hold->holders == 0 && !hold->acquiring)
            {
                hold->acquiring = true;
                break;
            }
            hold->cv.wait(lk);
        }
        --hold->waiters;
        lk.unlock();

        hold->token = fspec::uid::generate_lock_token();
        content = nlohmann::json{{"pid", get_pid()},
                                 {"host", this_host()},
                                 {"token", hold->token},
                                 {"acquired_at", fspec::format_tools::formatted_time(
                                                     std::chrono::system_clock::now())}}
                      .dump();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("InterProcessLock: preparing lock for '{}' failed: {}",
                     pImpl->lock_path.string(), e.what());
        pImpl->ec = std::make_error_code(std::errc::not_enough_memory);
        if (hold)
        {
            std::lock_guard<std::mutex> lk(g_holds_mtx);
            if (hold->acquiring)
            {
                hold->acquiring = false;
                hold->cv.notify_all();
            }
            drop_hold_if_unused_locked(pImpl->key, hold);
        }
        return;
    }

    int retries = 0;
    const std::error_code ec = os_acquire(pImpl->lock_path, content, config, retries);

    std::lock_guard<std::mutex> lk(g_holds_mtx);
    hold->acquiring = false;
    pImpl->retries = retries;
    if (!ec)
    {
        hold->holders = 1;
        hold->compromised = false;
        hold->lock_path = pImpl->lock_path;
        hold->update = config.update;
        hold->last_touch = std::chrono::steady_clock::now();
        pImpl->hold = hold;
        pImpl->valid = true;
    }
    else
    {
        pImpl->ec = ec;
        drop_hold_if_unused_locked(pImpl->key, hold);
    }
    hold->cv.notify_all();
}

static void release_impl(InterProcessLockImpl *pImpl) noexcept
{
    if (pImpl == nullptr || !pImpl->hold)
    {
        return;
    }
    std::shared_ptr<HoldState> hold = std::move(pImpl->hold);
    pImpl->hold.reset();
    pImpl->valid = false;

    std::lock_guard<std::mutex> lk(g_holds_mtx);
    if (--hold->holders > 0)
    {
        return;
    }

    if (check_ownership_locked(*hold))
    {
        std::error_code ec;
        fs::remove(hold->lock_path, ec);
        if (ec)
        {
            LOGGER_WARN("InterProcessLock: cannot remove lock file '{}': {}",
                        hold->lock_path.string(), ec.message());
        }
    }
    else
    {
        LOGGER_WARN("InterProcessLock: not removing '{}'; it is no longer ours",
                    hold->lock_path.string());
    }
    hold->token.clear();
    hold->compromised = false;
    hold->cv.notify_all();
    drop_hold_if_unused_locked(pImpl->key, hold);
}

void InterProcessLock::InterProcessLockImplDeleter::operator()(InterProcessLockImpl *p) const noexcept
{
    release_impl(p);
    delete p;
}

// Public Methods
InterProcessLock::InterProcessLock(const fs::path &target, const LockConfig &config) noexcept
    : pImpl(new (std::nothrow) InterProcessLockImpl)
{
    if (!lifecycle_initialized())
    {
        FSP_PANIC("InterProcessLock created before its module was initialized via "
                  "LifecycleManager. Aborting.");
    }
    if (pImpl != nullptr)
    {
        acquire(pImpl.get(), target, config);
    }
}

InterProcessLock::InterProcessLock() noexcept : pImpl(nullptr) {}
InterProcessLock::~InterProcessLock() = default;
InterProcessLock::InterProcessLock(InterProcessLock &&) noexcept = default;
InterProcessLock &InterProcessLock::operator=(InterProcessLock &&) noexcept = default;

std::optional<InterProcessLock> InterProcessLock::try_lock(const fs::path &target,
                                                           const LockConfig &config,
                                                           std::error_code *ec) noexcept
{
    if (!lifecycle_initialized())
    {
        if (ec != nullptr)
        {
            *ec = std::make_error_code(std::errc::operation_not_permitted);
        }
        return std::nullopt;
    }

    InterProcessLock lock;
    lock.pImpl.reset(new (std::nothrow) InterProcessLockImpl);
    if (lock.pImpl == nullptr)
    {
        if (ec != nullptr)
        {
            *ec = std::make_error_code(std::errc::not_enough_memory);
        }
        return std::nullopt;
    }
    acquire(lock.pImpl.get(), target, config);
    if (ec != nullptr)
    {
        *ec = lock.pImpl->ec;
    }
    if (lock.valid())
    {
        return {std::move(lock)};
    }
    return std::nullopt;
}

bool InterProcessLock::valid() const noexcept
{
    return pImpl && pImpl->valid;
}

std::error_code InterProcessLock::error_code() const noexcept
{
    return pImpl ? pImpl->ec : std::make_error_code(std::errc::not_enough_memory);
}

int InterProcessLock::retries() const noexcept
{
    return pImpl ? pImpl->retries : 0;
}

std::optional<fs::path> InterProcessLock::lock_file_path() const noexcept
{
    if (pImpl && pImpl->valid)
    {
        return pImpl->lock_path;
    }
    return std::nullopt;
}

std::error_code InterProcessLock::verify() const noexcept
{
    if (!pImpl || !pImpl->hold)
    {
        return std::make_error_code(std::errc::not_connected);
    }
    std::lock_guard<std::mutex> lk(g_holds_mtx);
    if (!check_ownership_locked(*pImpl->hold))
    {
        return std::make_error_code(std::errc::owner_dead);
    }
    return {};
}

void InterProcessLock::release() noexcept
{
    release_impl(pImpl.get());
}

fs::path InterProcessLock::lock_file_for(const fs::path &target)
{
    return fs::path(canonical_lock_key(target) + ".lock");
}

// Lifecycle Integration
bool InterProcessLock::lifecycle_initialized() noexcept
{
    return g_ipl_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_interprocess_lock_startup(const char *arg)
{
    (void)arg;
    {
        std::lock_guard<std::mutex> lk(g_holds_mtx);
        g_keeper_stop = false;
    }
    g_keeper_thread = std::thread(keeper_loop);
    g_ipl_initialized.store(true, std::memory_order_release);
}

void do_interprocess_lock_shutdown(const char *arg)
{
    (void)arg;
    g_ipl_initialized.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lk(g_holds_mtx);
        g_keeper_stop = true;
        for (const auto &[key, hold] : g_holds)
        {
            if (hold->holders > 0)
            {
                LOGGER_WARN("InterProcessLock: shutting down while '{}' is still held",
                            hold->lock_path.string());
            }
        }
    }
    g_keeper_cv.notify_all();
    if (g_keeper_thread.joinable())
    {
        g_keeper_thread.join();
    }
}
} // namespace

ModuleDef InterProcessLock::GetLifecycleModule()
{
    ModuleDef module("fspec::utils::InterProcessLock");
    module.add_dependency("fspec::utils::Logger");
    module.add_dependency("fspec::utils::LockConfig");
    module.set_startup(&do_interprocess_lock_startup);
    module.set_shutdown(&do_interprocess_lock_shutdown, kInterProcessLockShutdownTimeoutMs);
    return module;
}

} // namespace fspec::utils
