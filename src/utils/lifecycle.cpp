/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * `initialize()` builds a graph from the registered modules, orders it with
 * Kahn's algorithm and runs each startup callback. `finalize()` walks the same
 * order backwards. Shutdown callbacks run on their own thread with a real
 * deadline (thread + flag + poll, detach on timeout), so a hung module cannot
 * block process exit.
 ******************************************************************************/
#include "fsp_service.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fmt/ranges.h>

namespace
{
constexpr size_t kDebugInfoReserveBytes = 2048;

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > fspec::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(fspec::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread and waits at most `timeout` for it.
 *
 * The state shared with the thread is heap-allocated so that a detached thread
 * never touches this stack frame. A zero timeout waits without limit.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    struct SharedState
    {
        std::function<void()> func;
        std::atomic<bool> completed{false};
        std::exception_ptr error{nullptr};
    };
    auto state = std::make_shared<SharedState>();
    state->func = func;

    std::thread thread(
        [state]()
        {
            try
            {
                state->func();
            }
            catch (...)
            {
                state->error = std::current_exception();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }
    thread.join();

    if (state->error)
    {
        try
        {
            std::rethrow_exception(state->error);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "non-standard exception"};
        }
    }
    return {true, false, {}};
}

} // namespace

namespace fspec::utils
{

namespace lifecycle_internal
{
struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};
} // namespace lifecycle_internal

class ModuleDefImpl
{
  public:
    lifecycle_internal::InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        ShutdownTimeout,
        FailedShutdown
    };

    struct InternalGraphNode
    {
        std::string name;
        std::function<void()> startup;
        std::function<void()> shutdown;
        std::chrono::milliseconds shutdown_timeout{0};
        std::vector<std::string> dependencies;
        std::vector<InternalGraphNode *> dependents;
        ModuleStatus status{ModuleStatus::Registered};
    };

    LifecycleManagerImpl()
        : m_app_name(fspec::platform::get_executable_name()), m_pid(fspec::platform::get_pid())
    {
    }

    void registerStaticModule(lifecycle_internal::InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

  private:
    void buildStaticGraph();
    std::vector<InternalGraphNode *> topologicalSort();
    static void shutdownModuleWithTimeout(InternalGraphNode &mod, std::string &debug_info);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    std::string m_app_name;
    uint64_t m_pid;
    std::mutex m_registry_mutex;
    std::vector<lifecycle_internal::InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
};

void LifecycleManagerImpl::registerStaticModule(lifecycle_internal::InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        FSP_PANIC("[FSP_LifeCycle]\nEXEC[{}]:PID[{}]\n  "
                  "    **  FATAL: register_module('{}') called after initialization.",
                  m_app_name, m_pid, def.name);
    }
    m_registered_modules.push_back(std::move(def));
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[FSP_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              fspec::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildStaticGraph();
        m_startup_order = topologicalSort();
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        debug_info += fmt::format("     -> Starting module: '{}'...", mod->name);
        mod->status = ModuleStatus::Initializing;
        try
        {
            if (mod->startup)
            {
                mod->startup();
            }
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            FSP_DEBUG("{}", debug_info);
            printStatusAndAbort("\n     **** Exception during startup: " + std::string(e.what()),
                                mod->name);
        }
        mod->status = ModuleStatus::Started;
        debug_info += "done.\n";
    }
    debug_info += "     -> Application initialization complete.\n";
    FSP_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[FSP_LifeCycle] [{}]:PID[{}]\n"
                              "     **** finalize() triggered from {} ({}:{})\n"
                              "     <- Finalizing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              fspec::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        InternalGraphNode &mod = **it;
        if (mod.status == ModuleStatus::Started)
        {
            shutdownModuleWithTimeout(mod, debug_info);
        }
        else
        {
            mod.status = ModuleStatus::Shutdown;
            debug_info += fmt::format("     <- Shutting down module: '{}'...(no-op) done.\n",
                                      mod.name);
        }
    }
    debug_info += "     -> Application finalization complete.\n";
    FSP_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(InternalGraphNode &mod,
                                                     std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.name);

    auto outcome = timedShutdown(mod.shutdown, mod.shutdown_timeout);
    if (outcome.success)
    {
        mod.status = ModuleStatus::Shutdown;
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status = ModuleStatus::ShutdownTimeout;
        debug_info += fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.shutdown_timeout.count());
        fmt::print(stderr, "[FSP_LifeCycle] WARNING: module '{}' did not shut down within {}ms.\n",
                   mod.name, mod.shutdown_timeout.count());
    }
    else
    {
        mod.status = ModuleStatus::FailedShutdown;
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.name, outcome.exception_msg);
        fmt::print(stderr, "[FSP_LifeCycle] ERROR: module '{}' threw on shutdown: {}\n", mod.name,
                   outcome.exception_msg);
    }
}

void LifecycleManagerImpl::buildStaticGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        InternalGraphNode node;
        node.name = def.name;
        node.startup = std::move(def.startup);
        node.shutdown = std::move(def.shutdown);
        node.shutdown_timeout = def.shutdown_timeout;
        node.dependencies = std::move(def.dependencies);
        m_module_graph.emplace(def.name, std::move(node));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name + " (required by " +
                                         entry.first + ")");
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the whole module graph.
 * @throws std::runtime_error naming the modules left on a cycle.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *> LifecycleManagerImpl::topologicalSort()
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(m_module_graph.size());
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto &entry : m_module_graph)
    {
        in_degrees[&entry.second] = entry.second.dependencies.size();
    }

    std::vector<InternalGraphNode *> zero_degree_queue;
    for (auto &[node, degree] : in_degrees)
    {
        if (degree == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (--in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != m_module_graph.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[FSP_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[FSP_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}' [status {}]\n", name, static_cast<int>(node.status));
    }
    fmt::print(stderr, "---------------------\n\n");
    fspec::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager public API
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl)
    {
        pImpl->registerStaticModule(std::move(def.pImpl->def));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

} // namespace fspec::utils
