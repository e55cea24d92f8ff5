#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "fspec_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

// C4251: exported class holding a unique_ptr to an incomplete type (pimpl).
#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace fspec::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup and shutdown callback type.
 *
 * A plain function pointer so callbacks can cross shared-library boundaries. `arg`
 * is the string given to `set_startup(cb, arg)`, or `nullptr` when none was given.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for one lifecycle module: name, dependencies and callbacks.
 *
 * Movable, not copyable. Ownership passes to the LifecycleManager on registration.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class FSPEC_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares that this module needs `dependency_name` started first.
     *
     * The dependency is also shut down after this module. An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the startup callback and the string passed to it.
     * @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
     */
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout Maximum time the callback may take; `0ms` waits without limit.
     *                A callback that overruns is detached and reported.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace fspec::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
