#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Starts and stops the library's stateful modules in dependency order.
 *
 * Every module that owns process-wide state (the logger worker, the lock
 * configuration, the lock-file keeper thread) publishes a `ModuleDef` through
 * a static `GetLifecycleModule()`. The application hands those definitions to
 * a `LifecycleGuard` in `main`:
 *
 * ```cpp
 * int main() {
 *     fspec::utils::LifecycleGuard app_lifecycle(fspec::utils::MakeModDefList(
 *         fspec::utils::Logger::GetLifecycleModule(),
 *         fspec::utils::LockConfig::GetLifecycleModule(),
 *         fspec::utils::InterProcessLock::GetLifecycleModule()));
 *
 *     fspec::utils::InProcessLockRegistry registry;
 *     fspec::utils::LockedFileManager files(registry);
 *     // ...
 * }
 * ```
 *
 * `initialize()` topologically sorts the registered modules (cycles, duplicate
 * names and unknown dependencies abort with a status dump) and runs their
 * startup callbacks. `finalize()` runs the shutdown callbacks in reverse order,
 * each bounded by the timeout set in its `ModuleDef`.
 ******************************************************************************/
#include "fsp_base.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace fspec::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied definitions.
// Call-site: MakeModDefList(Logger::GetLifecycleModule(), LockConfig::GetLifecycleModule())
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief Process-wide registry of lifecycle modules.
 */
class FSPEC_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must happen before `initialize()`; registering
     *        afterwards is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Stops every started module in reverse order. Idempotent; a no-op
     *        if `initialize()` never ran.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules, initializes
 * the lifecycle and finalizes it on destruction. Later guards are no-ops: their
 * modules are ignored and a warning with a stack trace is printed in debug builds.
 */
class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @brief Finalizes the application if this guard is the owner.
     *
     * @warning Static objects in other translation units may be destroyed after
     *          this runs; they must not log or take locks from their destructors.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            FSP_DEBUG("[FSP_LifeCycle] LifecycleGuard owner destructing. Constructed in {} ({}:{})",
                      m_loc.function_name(),
                      fspec::format_tools::filename_only(m_loc.file_name()), m_loc.line());
            fspec::utils::FinalizeApp(m_loc);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                fspec::utils::RegisterModule(std::move(m));
            }
            fspec::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            FSP_DEBUG("[FSP_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                      "already exists; supplied modules were ignored. Constructed in {} ({}:{}).",
                      fspec::platform::get_executable_name(), fspec::platform::get_pid(),
                      m_loc.function_name(),
                      fspec::format_tools::filename_only(m_loc.file_name()), m_loc.line());
#if defined(FSPEC_ENABLE_DEBUG_MESSAGES)
            fspec::debug::print_stack_trace();
#endif
        }
    }

    bool m_is_owner{false};
};

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
