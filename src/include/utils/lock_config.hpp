#pragma once
/**
 * @file lock_config.hpp
 * @brief Tunables for the inter-process lock and lock metrics.
 *
 * The effective configuration is built in layers when the
 * "fspec::utils::LockConfig" lifecycle module starts:
 *
 *   1. built-in defaults (the member initializers below),
 *   2. an optional JSON file (`FSPEC_LOCK_CONFIG`, `set_config_path()` or the
 *      argument of `GetLifecycleModule()`),
 *   3. environment overrides `FSPEC_DEBUG_LOCKS`, `FSPEC_LOCK_STALE_MS`,
 *      `FSPEC_LOCK_RETRIES`,
 *   4. `sanitize()`, which clamps inconsistent values.
 *
 * Example config file (all keys optional):
 * ```json
 * { "stale_ms": 10000, "retries": 10, "min_timeout_ms": 50,
 *   "max_timeout_ms": 500, "factor": 2, "update_ms": 5000, "debug_locks": false }
 * ```
 */
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fspec_utils_export.h"
#include "utils/backoff_strategy.hpp"
#include "utils/module_def.hpp"

namespace fspec::utils
{

struct FSPEC_UTILS_EXPORT LockConfig
{
    static constexpr std::chrono::milliseconds kMinStale{2000};

    /// A lock file whose mtime is older than this is considered abandoned.
    std::chrono::milliseconds stale{10000};
    /// Inter-process acquisition attempts after the first one.
    int retries = 10;
    std::chrono::milliseconds min_timeout{50};
    std::chrono::milliseconds max_timeout{500};
    double factor = 2.0;
    /// How often a held lock file's mtime is refreshed.
    std::chrono::milliseconds update{5000};
    /// Emit `[LOCK]` metrics lines at debug level.
    bool debug_locks = false;

    [[nodiscard]] BoundedExponentialBackoff backoff() const noexcept
    {
        return BoundedExponentialBackoff{min_timeout, max_timeout, factor};
    }

    /**
     * @brief Overlays the keys present in @p doc onto @p base.
     * @throws std::invalid_argument if @p doc is not an object or a key has the wrong type.
     */
    static LockConfig from_json(const nlohmann::json &doc, const LockConfig &base);

    /**
     * @brief Applies `FSPEC_DEBUG_LOCKS`, `FSPEC_LOCK_STALE_MS` and `FSPEC_LOCK_RETRIES`.
     * @return Warnings for values that could not be parsed (those are ignored).
     */
    std::vector<std::string> apply_environment();

    /**
     * @brief Clamps the values into a consistent range.
     * @return One warning per adjusted value.
     */
    std::vector<std::string> sanitize();

    /**
     * @brief Defaults, then @p config_file (if non-empty), then the environment,
     *        then sanitize(). Problems are logged as warnings; never throws.
     * @note Requires the Logger module.
     */
    static LockConfig load(const std::filesystem::path &config_file);

    /**
     * @brief The configuration loaded at startup.
     * @note Panics if the LockConfig module is not initialized.
     */
    static LockConfig current();

    /// Config file to use at startup. Has no effect once the module is initialized.
    static void set_config_path(std::string_view path);

    /**
     * @brief Lifecycle module "fspec::utils::LockConfig" (depends on the Logger).
     * @param config_path Config file; when empty `set_config_path()` and then
     *                    `FSPEC_LOCK_CONFIG` are consulted.
     */
    static ModuleDef GetLifecycleModule(std::string_view config_path = {});

    static bool lifecycle_initialized() noexcept;
};

} // namespace fspec::utils
