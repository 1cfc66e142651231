#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * @see src/utils/lifecycle.cpp
 *
 * Modules declare their dependencies by name; the `LifecycleManager` performs a
 * topological sort to start them in order and shuts them down in reverse order.
 * A dependency cycle or an undefined dependency is a fatal error. Each shutdown
 * callback runs under a per-module timeout so a hanging module cannot block
 * process exit.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     nodebus::utils::LifecycleGuard app_lifecycle(
 *         nodebus::utils::MakeModDefList(nodebus::utils::Logger::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     // ... build and run a NodeBus ...
 *     return 0;
 * } // FinalizeApp() runs here
 * ```
 ******************************************************************************/
#include "nb_base.hpp"
#include "nodebus_utils_export.h"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::utils
{

class LifecycleManagerImpl;

/// @brief Constructs a vector<ModuleDef> by moving the supplied ModuleDef args.
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
 * @brief The singleton manager for the application lifecycle.
 */
class NODEBUS_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must be called before `initialize()`; registering
     *        afterwards is a fatal error.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order. Idempotent.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts modules down in reverse start order. Idempotent.
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
 * The first guard constructed registers its modules and calls InitializeApp(); its
 * destructor calls FinalizeApp(). Any later guard is a no-op and says so on stderr.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        NB_DEBUG("[NB_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                 m_loc.function_name(), nodebus::format_tools::filename_only(m_loc.file_name()),
                 m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            nodebus::utils::FinalizeApp(m_loc);
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
                nodebus::utils::RegisterModule(std::move(m));
            }
            nodebus::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            fmt::print(stderr,
                       "[NB_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an owner "
                       "already exists. This guard is a no-op; provided modules (if any) were "
                       "ignored. ({}:{})\n",
                       nodebus::platform::get_executable_name(), nodebus::platform::get_pid(),
                       nodebus::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace nodebus::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
