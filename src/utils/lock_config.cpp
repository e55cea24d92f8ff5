#include "fsp_service.hpp"
#include "utils/lock_config.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace fspec::format_tools;

static std::atomic<bool> g_lockconfig_initialized{false};

namespace fspec::utils
{

namespace
{
constexpr std::chrono::milliseconds kLockConfigShutdownTimeoutMs{1000};

std::mutex g_config_mtx;
LockConfig g_current_config;
std::string g_config_path_override;

std::chrono::milliseconds json_ms(const nlohmann::json &doc, const char *key,
                                  std::chrono::milliseconds fallback)
{
    auto it = doc.find(key);
    if (it == doc.end())
    {
        return fallback;
    }
    if (!it->is_number_integer() || it->get<long long>() < 0)
    {
        throw std::invalid_argument(
            fmt::format("LockConfig: '{}' must be a non-negative integer (milliseconds)", key));
    }
    return std::chrono::milliseconds(it->get<long long>());
}

std::optional<uint64_t> env_uint(const char *name, std::vector<std::string> &warnings)
{
    const char *raw = std::getenv(name);
    if (raw == nullptr)
    {
        return std::nullopt;
    }
    auto value = parse_uint(trim_whitespace(raw));
    if (!value)
    {
        warnings.push_back(fmt::format("ignoring {}='{}': not a non-negative integer", name, raw));
    }
    return value;
}
} // namespace

LockConfig LockConfig::from_json(const nlohmann::json &doc, const LockConfig &base)
{
    if (!doc.is_object())
    {
        throw std::invalid_argument("LockConfig: top-level JSON value must be an object");
    }

    LockConfig cfg = base;
    cfg.stale = json_ms(doc, "stale_ms", cfg.stale);
    cfg.min_timeout = json_ms(doc, "min_timeout_ms", cfg.min_timeout);
    cfg.max_timeout = json_ms(doc, "max_timeout_ms", cfg.max_timeout);

    // update_ms follows stale_ms unless given explicitly.
    if (doc.contains("stale_ms") && !doc.contains("update_ms"))
    {
        cfg.update = cfg.stale / 2;
    }
    cfg.update = json_ms(doc, "update_ms", cfg.update);

    if (auto it = doc.find("retries"); it != doc.end())
    {
        if (!it->is_number_integer() || it->get<long long>() < 0)
        {
            throw std::invalid_argument("LockConfig: 'retries' must be a non-negative integer");
        }
        cfg.retries = it->get<int>();
    }
    if (auto it = doc.find("factor"); it != doc.end())
    {
        if (!it->is_number())
        {
            throw std::invalid_argument("LockConfig: 'factor' must be a number");
        }
        cfg.factor = it->get<double>();
    }
    if (auto it = doc.find("debug_locks"); it != doc.end())
    {
        if (!it->is_boolean())
        {
            throw std::invalid_argument("LockConfig: 'debug_locks' must be a boolean");
        }
        cfg.debug_locks = it->get<bool>();
    }
    return cfg;
}

std::vector<std::string> LockConfig::apply_environment()
{
    std::vector<std::string> warnings;

    if (std::getenv("FSPEC_DEBUG_LOCKS") != nullptr)
    {
        debug_locks = is_truthy(std::getenv("FSPEC_DEBUG_LOCKS"));
    }
    if (auto v = env_uint("FSPEC_LOCK_STALE_MS", warnings))
    {
        stale = std::chrono::milliseconds(static_cast<long long>(*v));
        update = stale / 2;
    }
    if (auto v = env_uint("FSPEC_LOCK_RETRIES", warnings))
    {
        retries = static_cast<int>(std::min<uint64_t>(*v, 1000));
    }
    return warnings;
}

std::vector<std::string> LockConfig::sanitize()
{
    std::vector<std::string> warnings;

    if (stale < kMinStale)
    {
        warnings.push_back(fmt::format("stale_ms {} is below the minimum, using {}",
                                       stale.count(), kMinStale.count()));
        stale = kMinStale;
    }
    if (update.count() <= 0 || update >= stale)
    {
        const auto adjusted = stale / 2;
        warnings.push_back(fmt::format("update_ms {} must be positive and below stale_ms {}, "
                                       "using {}",
                                       update.count(), stale.count(), adjusted.count()));
        update = adjusted;
    }
    if (retries < 0)
    {
        warnings.push_back(fmt::format("retries {} is negative, using 0", retries));
        retries = 0;
    }
    if (min_timeout.count() <= 0)
    {
        warnings.push_back(
            fmt::format("min_timeout_ms {} must be positive, using 1", min_timeout.count()));
        min_timeout = std::chrono::milliseconds(1);
    }
    if (min_timeout > max_timeout)
    {
        warnings.push_back(fmt::format("min_timeout_ms {} exceeds max_timeout_ms {}, using {}",
                                       min_timeout.count(), max_timeout.count(),
                                       min_timeout.count()));
        max_timeout = min_timeout;
    }
    if (factor < 1.0)
    {
        warnings.push_back(fmt::format("factor {} is below 1, using 1", factor));
        factor = 1.0;
    }
    return warnings;
}

LockConfig LockConfig::load(const fs::path &config_file)
{
    LockConfig cfg;

    if (!config_file.empty())
    {
        try
        {
            std::ifstream in(config_file);
            if (!in)
            {
                LOGGER_WARN("LockConfig: cannot open config file '{}'; using defaults",
                            config_file.string());
            }
            else
            {
                cfg = from_json(nlohmann::json::parse(in), cfg);
            }
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("LockConfig: ignoring config file '{}': {}", config_file.string(),
                        e.what());
        }
    }

    for (const auto &w : cfg.apply_environment())
    {
        LOGGER_WARN("LockConfig: {}", w);
    }
    for (const auto &w : cfg.sanitize())
    {
        LOGGER_WARN("LockConfig: {}", w);
    }
    return cfg;
}

LockConfig LockConfig::current()
{
    if (!lifecycle_initialized())
    {
        FSP_PANIC("LockConfig::current() called before the LockConfig module was initialized "
                  "via LifecycleManager. Aborting.");
    }
    std::lock_guard<std::mutex> lock(g_config_mtx);
    return g_current_config;
}

void LockConfig::set_config_path(std::string_view path)
{
    std::lock_guard<std::mutex> lock(g_config_mtx);
    g_config_path_override = std::string(path);
}

bool LockConfig::lifecycle_initialized() noexcept
{
    return g_lockconfig_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_lockconfig_startup(const char *arg)
{
    std::string path = (arg != nullptr) ? std::string(arg) : std::string();
    if (path.empty())
    {
        std::lock_guard<std::mutex> lock(g_config_mtx);
        path = g_config_path_override;
    }
    if (path.empty())
    {
        const char *env = std::getenv("FSPEC_LOCK_CONFIG");
        path = (env != nullptr) ? std::string(trim_whitespace(env)) : std::string();
    }

    LockConfig cfg = LockConfig::load(path);
    LOGGER_INFO("LockConfig: stale={}ms update={}ms retries={} backoff={}..{}ms x{} "
                "debug_locks={}{}",
                cfg.stale.count(), cfg.update.count(), cfg.retries, cfg.min_timeout.count(),
                cfg.max_timeout.count(), cfg.factor, cfg.debug_locks,
                path.empty() ? std::string() : fmt::format(" (file '{}')", path));
    // Metrics are debug lines; a quieter logger would drop them.
    if (cfg.debug_locks)
    {
        Logger &logger = Logger::instance();
        if (static_cast<int>(logger.level()) > static_cast<int>(Logger::Level::L_DEBUG))
        {
            logger.set_level(Logger::Level::L_DEBUG);
            LOGGER_INFO("LockConfig: debug_locks is set; logger level lowered to DEBUG");
        }
    }
    {
        std::lock_guard<std::mutex> lock(g_config_mtx);
        g_current_config = cfg;
    }
    g_lockconfig_initialized.store(true, std::memory_order_release);
}

void do_lockconfig_shutdown(const char *arg)
{
    (void)arg;
    g_lockconfig_initialized.store(false, std::memory_order_release);
}
} // namespace

ModuleDef LockConfig::GetLifecycleModule(std::string_view config_path)
{
    ModuleDef module("fspec::utils::LockConfig");
    module.add_dependency("fspec::utils::Logger");
    module.set_startup(&do_lockconfig_startup, config_path);
    module.set_shutdown(&do_lockconfig_shutdown, kLockConfigShutdownTimeoutMs);
    return module;
}

} // namespace fspec::utils
