#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "nodebus_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * A C-style function pointer has a standardised calling convention across shared
 * library boundaries, unlike `std::function`. `arg` is `nullptr` when no argument was
 * supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief An ABI-safe builder for a lifecycle module definition.
 *
 * Movable but not copyable. Once registered with the `LifecycleManager`, ownership is
 * transferred. Names longer than `MAX_MODULE_NAME_LEN` are rejected with
 * `std::length_error`.
 */
class NODEBUS_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @param name Unique name for this module (e.g. `"nodebus::utils::Logger"`).
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
     * @brief Declares a dependency on another module, which is started before this one and
     *        shut down after it. An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @param arg Forwarded to `startup_func` as a null-terminated C-string.
     * @throws std::length_error if `arg.size() > MAX_CALLBACK_PARAM_STRLEN`.
     */
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @param timeout Maximum time allowed for the callback to complete. A callback that
     *                overruns it is abandoned and the module is marked as timed out.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace nodebus::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
