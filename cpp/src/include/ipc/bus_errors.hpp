#pragma once
/**
 * @file bus_errors.hpp
 * @brief Exceptions thrown by the bus. All derive from BusError.
 *
 * Handler failures and routing anomalies are not thrown; they are reported to the
 * ErrorCollector. These exceptions cover configuration and usage errors.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <stdexcept>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251 4275)
#endif

namespace nodebus::ipc
{

class NODEBUS_UTILS_EXPORT BusError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// One required handler a class failed to provide.
struct MissingHandler
{
    Channel channel;
    std::string handler;
    std::string required_by;
};

/**
 * @brief Thrown by ClassRegistry::define when a class leaves required handlers
 *        without an implementation or default. Lists every missing entry.
 *
 * Message format:
 * @code
 * [BOOT ERROR] Node 'Turret' missing required handlers:
 *   - In.onHit (required by: Damageable, no default provided)
 * @endcode
 */
class NODEBUS_UTILS_EXPORT ContractViolation : public BusError
{
  public:
    ContractViolation(std::string class_name, std::vector<MissingHandler> missing);

    [[nodiscard]] const std::string &class_name() const noexcept { return m_class_name; }
    [[nodiscard]] const std::vector<MissingHandler> &missing() const noexcept
    {
        return m_missing;
    }

  private:
    std::string m_class_name;
    std::vector<MissingHandler> m_missing;
};

class NODEBUS_UTILS_EXPORT ClassNotFound : public BusError
{
  public:
    explicit ClassNotFound(const std::string &class_name);
};

class NODEBUS_UTILS_EXPORT DuplicateClass : public BusError
{
  public:
    explicit DuplicateClass(const std::string &class_name);
};

class NODEBUS_UTILS_EXPORT DuplicateInstance : public BusError
{
  public:
    explicit DuplicateInstance(const std::string &instance_id);
};

class NODEBUS_UTILS_EXPORT UnknownMode : public BusError
{
  public:
    explicit UnknownMode(const std::string &mode_name);
};

/// A mode's base chain loops back on itself. Fatal configuration error.
class NODEBUS_UTILS_EXPORT ModeInheritanceCycle : public BusError
{
  public:
    explicit ModeInheritanceCycle(const std::vector<std::string> &chain);
};

class NODEBUS_UTILS_EXPORT LifecycleOrderError : public BusError
{
  public:
    using BusError::BusError;
};

/// Non-fatal outcome of handler resolution.
enum class ResolveError
{
    HandlerNotFound,
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
