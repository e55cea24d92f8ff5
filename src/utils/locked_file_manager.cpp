#include "fsp_service.hpp"
#include "utils/atomic_writer.hpp"
#include "utils/inter_process_lock.hpp"
#include "utils/locked_file_manager.hpp"

#include <optional>

#if defined(FSPEC_IS_POSIX)
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#else
#include <fstream>
#include <iterator>
#endif

namespace fs = std::filesystem;
using fspec::basics::make_scope_guard;

namespace fspec::utils
{

namespace
{
using Clock = std::chrono::steady_clock;

std::chrono::milliseconds ms_between(Clock::time_point from, Clock::time_point to)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

fs::path canonical_target(const fs::path &path)
{
    if (path.empty())
    {
        throw fs::filesystem_error("LockedFileManager: empty path", path,
                                   std::make_error_code(std::errc::invalid_argument));
    }
    return fs::path(canonical_lock_key(path));
}

/**
 * Reads the whole file. std::nullopt with @p ec set on failure; ENOENT is reported
 * as `no_such_file_or_directory`.
 */
std::optional<std::string> read_file_text(const fs::path &path, std::error_code &ec)
{
    ec.clear();
#if defined(FSPEC_IS_POSIX)
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
    std::string content;
    char buf[8192];
    for (;;)
    {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            ec = std::error_code(errno, std::generic_category());
            ::close(fd);
            return std::nullopt;
        }
        content.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return content;
#else
    if (!fs::exists(path, ec))
    {
        if (!ec)
        {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return std::nullopt;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
#endif
}

nlohmann::json parse_document(const std::string &text, const fs::path &path)
{
    try
    {
        return nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ParseError(fmt::format("Invalid JSON in '{}': {}", path.string(), e.what()), path);
    }
}

void throw_if_not_acquired(const InterProcessLock &lock, const fs::path &target, int retries)
{
    if (lock.valid())
    {
        return;
    }
    const std::error_code ec = lock.error_code();
    if (ec == std::errc::timed_out)
    {
        throw LockTimeoutError(fmt::format("Timed out acquiring the lock on '{}' after {} retries",
                                           target.string(), retries),
                               target);
    }
    throw fs::filesystem_error("LockedFileManager: cannot acquire the inter-process lock",
                               target, ec);
}

void throw_if_compromised(const InterProcessLock &lock, const fs::path &target)
{
    if (lock.verify())
    {
        throw LockCompromisedError(
            fmt::format("Lock on '{}' was compromised while held", target.string()), target);
    }
}
} // namespace

LockedFileManager::LockedFileManager(InProcessLockRegistry &registry)
    : LockedFileManager(registry, LockConfig::current())
{
}

LockedFileManager::LockedFileManager(InProcessLockRegistry &registry, LockConfig config)
    : m_registry(registry), m_config(std::move(config)), m_metrics(m_config.debug_locks)
{
    if (!InterProcessLock::lifecycle_initialized())
    {
        FSP_PANIC("LockedFileManager created before the InterProcessLock module was initialized "
                  "via LifecycleManager. Aborting.");
    }
}

std::string LockedFileManager::serialize(const nlohmann::json &doc, const fs::path &path)
{
    try
    {
        std::string out = doc.dump(2);
        out.push_back('\n');
        return out;
    }
    catch (const nlohmann::json::type_error &e)
    {
        throw LockedFileError(
            fmt::format("Cannot serialize document for '{}': {}", path.string(), e.what()), path);
    }
}

nlohmann::json LockedFileManager::read_json(const fs::path &path,
                                            const nlohmann::json &default_value)
{
    const fs::path target = canonical_target(path);
    const auto start = Clock::now();

    InterProcessLock ipl(target, m_config);
    throw_if_not_acquired(ipl, target, m_config.retries);

    m_registry.acquire_read(target);
    auto read_guard = make_scope_guard([&]() noexcept { m_registry.release_read(target); });
    const auto held_since = Clock::now();

    std::error_code ec;
    std::optional<std::string> text = read_file_text(target, ec);
    if (!text)
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            read_guard.invoke();
            ipl.release();
            return create_default(target, default_value);
        }
        throw fs::filesystem_error("LockedFileManager::read_json: cannot read file", target, ec);
    }

    nlohmann::json doc = parse_document(*text, target);
    throw_if_compromised(ipl, target);

    m_metrics.record(LockType::Read, target, ms_between(start, held_since),
                     ms_between(held_since, Clock::now()), ipl.retries());
    return doc;
}

nlohmann::json LockedFileManager::create_default(const fs::path &target,
                                                 const nlohmann::json &default_value)
{
    const auto start = Clock::now();

    InterProcessLock ipl(target, m_config);
    throw_if_not_acquired(ipl, target, m_config.retries);

    m_registry.acquire_write(target);
    auto write_guard = make_scope_guard([&]() noexcept { m_registry.release_write(target); });
    const auto held_since = Clock::now();

    // Someone may have created the file between our read and this write lock.
    std::error_code ec;
    if (std::optional<std::string> text = read_file_text(target, ec))
    {
        nlohmann::json doc = parse_document(*text, target);
        throw_if_compromised(ipl, target);
        return doc;
    }
    if (ec != std::errc::no_such_file_or_directory)
    {
        throw fs::filesystem_error("LockedFileManager::read_json: cannot read file", target, ec);
    }

    const std::string out = serialize(default_value, target);
    throw_if_compromised(ipl, target);
    atomic_write_file(target, out, ec);
    if (ec)
    {
        throw fs::filesystem_error("LockedFileManager::read_json: cannot create file", target,
                                   ec);
    }

    m_metrics.record(LockType::Write, target, ms_between(start, held_since),
                     ms_between(held_since, Clock::now()), ipl.retries());
    return default_value;
}

void LockedFileManager::transaction(const fs::path &path, const MutateFn &fn)
{
    const fs::path target = canonical_target(path);
    const auto start = Clock::now();

    InterProcessLock ipl(target, m_config);
    throw_if_not_acquired(ipl, target, m_config.retries);

    m_registry.acquire_write(target);
    auto write_guard = make_scope_guard([&]() noexcept { m_registry.release_write(target); });
    const auto held_since = Clock::now();

    std::error_code ec;
    nlohmann::json data;
    if (std::optional<std::string> text = read_file_text(target, ec))
    {
        data = parse_document(*text, target);
    }
    else if (ec == std::errc::no_such_file_or_directory)
    {
        data = nlohmann::json::object();
    }
    else
    {
        throw fs::filesystem_error("LockedFileManager::transaction: cannot read file", target,
                                   ec);
    }

    // An exception from fn leaves the file untouched and propagates as is.
    fn(data);

    const std::string out = serialize(data, target);
    throw_if_compromised(ipl, target);
    atomic_write_file(target, out, ec);
    if (ec)
    {
        throw fs::filesystem_error("LockedFileManager::transaction: atomic write failed", target,
                                   ec);
    }

    m_metrics.record(LockType::Write, target, ms_between(start, held_since),
                     ms_between(held_since, Clock::now()), ipl.retries());
}

} // namespace fspec::utils
