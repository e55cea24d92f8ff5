#include "fsp_service.hpp"
#include "utils/in_process_lock.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace fs = std::filesystem;

namespace fspec::utils
{

std::string canonical_lock_key(const fs::path &path)
{
    return fs::weakly_canonical(fs::absolute(path)).generic_string();
}

namespace
{
// One blocked caller. `woken` is set under the registry mutex by whoever hands over.
struct Waiter
{
    bool woken = false;
    std::condition_variable cv;
};

struct LockState
{
    std::size_t reader_count = 0;
    bool writer_held = false;
    std::deque<std::shared_ptr<Waiter>> waiting_readers;
    std::deque<std::shared_ptr<Waiter>> waiting_writers;
};

void wake(const std::shared_ptr<Waiter> &w)
{
    w->woken = true;
    w->cv.notify_one();
}

void wait_until_woken(std::unique_lock<std::mutex> &lk, const std::shared_ptr<Waiter> &w)
{
    w->cv.wait(lk, [&w] { return w->woken; });
}
} // namespace

struct InProcessLockRegistry::Impl
{
    mutable std::mutex mtx;
    std::unordered_map<std::string, std::unique_ptr<LockState>> states;

    // Caller holds mtx. Entries live until reset().
    LockState &state_for(const std::string &key)
    {
        auto &slot = states[key];
        if (!slot)
        {
            slot = std::make_unique<LockState>();
        }
        return *slot;
    }
};

InProcessLockRegistry::InProcessLockRegistry() : pImpl(std::make_unique<Impl>()) {}

InProcessLockRegistry::~InProcessLockRegistry() = default;

void InProcessLockRegistry::acquire_read(const fs::path &path)
{
    const std::string key = canonical_lock_key(path);
    std::unique_lock<std::mutex> lk(pImpl->mtx);
    LockState &st = pImpl->state_for(key);

    if (!st.writer_held)
    {
        ++st.reader_count;
        return;
    }

    auto waiter = std::make_shared<Waiter>();
    st.waiting_readers.push_back(waiter);
    // release_write() counts us in before waking us.
    wait_until_woken(lk, waiter);
}

void InProcessLockRegistry::release_read(const fs::path &path)
{
    const std::string key = canonical_lock_key(path);
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto it = pImpl->states.find(key);
    if (it == pImpl->states.end() || it->second->reader_count == 0)
    {
        FSP_PANIC("InProcessLockRegistry::release_read: '{}' has no reader to release", key);
    }
    LockState &st = *it->second;

    if (--st.reader_count == 0 && !st.waiting_writers.empty())
    {
        auto next = st.waiting_writers.front();
        st.waiting_writers.pop_front();
        wake(next);
    }
}

void InProcessLockRegistry::acquire_write(const fs::path &path)
{
    const std::string key = canonical_lock_key(path);
    std::unique_lock<std::mutex> lk(pImpl->mtx);
    LockState &st = pImpl->state_for(key);

    bool first_attempt = true;
    while (st.reader_count != 0 || st.writer_held)
    {
        auto waiter = std::make_shared<Waiter>();
        // A writer that was woken but lost the race keeps its place at the head.
        if (first_attempt)
        {
            st.waiting_writers.push_back(waiter);
        }
        else
        {
            st.waiting_writers.push_front(waiter);
        }
        first_attempt = false;
        wait_until_woken(lk, waiter);
    }
    st.writer_held = true;
}

void InProcessLockRegistry::release_write(const fs::path &path)
{
    const std::string key = canonical_lock_key(path);
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto it = pImpl->states.find(key);
    if (it == pImpl->states.end() || !it->second->writer_held)
    {
        FSP_PANIC("InProcessLockRegistry::release_write: '{}' has no writer to release", key);
    }
    LockState &st = *it->second;
    st.writer_held = false;

    if (!st.waiting_readers.empty())
    {
        st.reader_count += st.waiting_readers.size();
        for (const auto &w : st.waiting_readers)
        {
            wake(w);
        }
        st.waiting_readers.clear();
    }
    else if (!st.waiting_writers.empty())
    {
        auto next = st.waiting_writers.front();
        st.waiting_writers.pop_front();
        wake(next);
    }
}

InProcessLockRegistry::Snapshot InProcessLockRegistry::snapshot(const fs::path &path) const
{
    const std::string key = canonical_lock_key(path);
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    Snapshot snap;
    auto it = pImpl->states.find(key);
    if (it != pImpl->states.end())
    {
        const LockState &st = *it->second;
        snap.reader_count = st.reader_count;
        snap.writer_held = st.writer_held;
        snap.waiting_readers = st.waiting_readers.size();
        snap.waiting_writers = st.waiting_writers.size();
    }
    return snap;
}

void InProcessLockRegistry::reset()
{
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    for (const auto &[key, st] : pImpl->states)
    {
        if (st->reader_count != 0 || st->writer_held || !st->waiting_readers.empty() ||
            !st->waiting_writers.empty())
        {
            FSP_PANIC("InProcessLockRegistry::reset: '{}' is still in use "
                      "(readers {}, writer {}, waiting {}/{})",
                      key, st->reader_count, st->writer_held, st->waiting_readers.size(),
                      st->waiting_writers.size());
        }
    }
    pImpl->states.clear();
}

std::size_t InProcessLockRegistry::size() const
{
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->states.size();
}

// --- Guards ---

InProcessLockRegistry::ReadGuard::ReadGuard(InProcessLockRegistry &registry, fs::path path)
    : m_registry(registry), m_path(std::move(path))
{
    m_registry.acquire_read(m_path);
}

InProcessLockRegistry::ReadGuard::~ReadGuard()
{
    m_registry.release_read(m_path);
}

InProcessLockRegistry::WriteGuard::WriteGuard(InProcessLockRegistry &registry, fs::path path)
    : m_registry(registry), m_path(std::move(path))
{
    m_registry.acquire_write(m_path);
}

InProcessLockRegistry::WriteGuard::~WriteGuard()
{
    m_registry.release_write(m_path);
}

} // namespace fspec::utils
