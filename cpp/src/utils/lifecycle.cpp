/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 * @see include/utils/module_def.hpp (for MAX_MODULE_NAME_LEN)
 *
 * **Implementation Details**
 *
 * 1.  **Registration**: modules are collected by `register_module()` until
 *     `initialize()` runs. Registering afterwards is fatal.
 *
 * 2.  **Initialization**: `initialize()` builds a graph from the registered
 *     modules, sorts it topologically (Kahn) and starts each module in order.
 *     A cycle, an undefined dependency or a throwing startup aborts the process
 *     with a status dump.
 *
 * 3.  **Timed Shutdown**: `finalize()` shuts modules down in reverse order. Each
 *     callback runs on its own thread with a real deadline (thread+flag+poll+detach,
 *     not std::async, whose destructor blocks even after wait_for times out).
 ******************************************************************************/
#include "nb_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fmt/ranges.h>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
/**
 * @brief Validates a module name: non-empty, within MAX_MODULE_NAME_LEN.
 * @throws std::invalid_argument if `name` is empty.
 * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
 */
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > nodebus::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(nodebus::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
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
 * @brief Runs `func` on a thread with a real deadline. On timeout the thread is
 *        detached and the call returns without waiting further.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    // Shared so a detached thread never touches a dead stack frame.
    struct State
    {
        std::function<void()> func;
        std::atomic<bool> completed{false};
        std::exception_ptr ex_ptr{nullptr};
    };
    auto state = std::make_shared<State>();
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
                state->ex_ptr = std::current_exception();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }

    thread.join();

    if (state->ex_ptr)
    {
        try
        {
            std::rethrow_exception(state->ex_ptr);
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

constexpr size_t kDebugInfoReserveBytes = 4096;

} // namespace

namespace nodebus::utils
{

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
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

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: shutdown argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.shutdown = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(nodebus::platform::get_pid()),
          m_app_name(nodebus::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    struct GraphNode
    {
        explicit GraphNode(InternalModuleDef def_in) : def(std::move(def_in)) {}

        InternalModuleDef def;
        std::vector<GraphNode *> dependents;
        ModuleStatus status{ModuleStatus::Registered};
    };

    void registerModule(InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized() const
    {
        return m_is_initialized.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_finalized() const
    {
        return m_is_finalized.load(std::memory_order_acquire);
    }

  private:
    void buildGraph();
    static std::vector<GraphNode *> topologicalSort(const std::vector<GraphNode *> &nodes);
    static void shutdownModuleWithTimeout(GraphNode &mod, std::string &debug_info);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    const uint64_t m_pid;
    const std::string m_app_name;
    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};
    std::mutex m_registry_mutex;
    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, GraphNode, std::less<>> m_module_graph;
    std::vector<GraphNode *> m_startup_order;
};

void LifecycleManagerImpl::registerModule(InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        NB_PANIC("[NB_LifeCycle] register_module('{}') called after initialize(). Aborting.",
                 def.name);
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

    debug_info += fmt::format("[NB_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              nodebus::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildGraph();
        std::vector<GraphNode *> nodes;
        nodes.reserve(m_module_graph.size());
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        try
        {
            debug_info += fmt::format("     -> Starting module: '{}'...", mod->def.name);
            mod->status = ModuleStatus::Initializing;
            if (mod->def.startup)
            {
                mod->def.startup();
            }
            mod->status = ModuleStatus::Started;
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            NB_DEBUG("{}", debug_info);
            printStatusAndAbort("\n     **** Exception during startup: " + std::string(e.what()),
                                mod->def.name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    NB_DEBUG("{}", debug_info);
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
    debug_info +=
        fmt::format("[NB_LifeCycle] [{}]:PID[{}]\n"
                    "     **** finalize() called, associated with a constructor from {} ({}:{}):\n"
                    "     <- Finalizing application...\n",
                    m_app_name, m_pid, loc.function_name(),
                    nodebus::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        GraphNode *mod = *it;
        if (mod->status == ModuleStatus::Started)
        {
            shutdownModuleWithTimeout(*mod, debug_info);
        }
        else
        {
            mod->status = ModuleStatus::Shutdown;
            debug_info +=
                fmt::format("     <- Shutting down module: '{}'...(no-op) done.\n", mod->def.name);
        }
    }
    debug_info += "     -> Application finalization complete.\n";
    NB_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(GraphNode &mod, std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.def.name);

    auto outcome = timedShutdown(mod.def.shutdown, mod.def.shutdown_timeout);
    if (outcome.success)
    {
        mod.status = ModuleStatus::Shutdown;
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status = ModuleStatus::ShutdownTimeout;
        debug_info +=
            fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.def.shutdown_timeout.count());
    }
    else
    {
        mod.status = ModuleStatus::FailedShutdown;
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.def.name, outcome.exception_msg);
    }
}

/**
 * @brief Builds the dependency graph from the registered modules.
 * @throws std::runtime_error on a duplicate name or an undefined dependency.
 */
void LifecycleManagerImpl::buildGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        std::string key = def.name;
        m_module_graph.emplace(std::move(key), GraphNode(std::move(def)));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.def.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over `nodes`.
 * @throws std::runtime_error if the graph has a cycle.
 */
std::vector<LifecycleManagerImpl::GraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<GraphNode *> &nodes)
{
    std::vector<GraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<GraphNode *> zero_degree_queue;
    std::map<GraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        GraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (GraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[NB_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[NB_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}' [{}]\n", name, static_cast<int>(node.status));
    }
    fmt::print(stderr, "---------------------\n\n");
    nodebus::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// LifecycleManager public API

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerModule(std::move(def.pImpl->def));
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
    return pImpl->is_initialized();
}

bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}

} // namespace nodebus::utils
