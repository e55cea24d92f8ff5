#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace fspec::basics
{

/**
 * @class ScopeGuard
 * @brief RAII guard that runs a cleanup callable on scope exit.
 *
 * The guard runs its callable when the enclosing scope is left, by normal flow or
 * by an exception. It is movable but not copyable; a moved-from guard is inactive.
 *
 * The callable must be `noexcept`-invocable. Cleanup that can fail has to handle
 * the failure itself (for example by logging it), because the guard runs during
 * stack unwinding.
 *
 * @code
 *  registry.acquire_write(key);
 *  auto release = fspec::basics::make_scope_guard(
 *      [&]() noexcept { registry.release_write(key); });
 *  mutate(data); // may throw; the write lock is still released
 * @endcode
 *
 * Guards declared one after another in a scope run in reverse order of
 * declaration, so acquiring A then B and guarding each releases B then A.
 *
 * Not thread-safe: a single guard must not be touched by multiple threads.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>,
                  "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept.");

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (if still active) and deactivates the guard.
     */
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard holding a decayed copy of @p f.
 * @note References captured by @p f must outlive the guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace fspec::basics
