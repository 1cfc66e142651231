#include "ipc/bus_errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace nodebus::ipc
{

namespace
{
std::string format_contract_violation(const std::string &class_name,
                                      const std::vector<MissingHandler> &missing)
{
    std::string msg = fmt::format("[BOOT ERROR] Node '{}' missing required handlers:", class_name);
    for (const auto &entry : missing)
    {
        msg += fmt::format("\n  - {}.{} (required by: {}, no default provided)",
                           to_string(entry.channel), entry.handler, entry.required_by);
    }
    return msg;
}
} // namespace

ContractViolation::ContractViolation(std::string class_name, std::vector<MissingHandler> missing)
    : BusError(format_contract_violation(class_name, missing)), m_class_name(std::move(class_name)),
      m_missing(std::move(missing))
{
}

ClassNotFound::ClassNotFound(const std::string &class_name)
    : BusError(fmt::format("node class '{}' is not registered", class_name))
{
}

DuplicateClass::DuplicateClass(const std::string &class_name)
    : BusError(fmt::format("node class '{}' is already registered", class_name))
{
}

DuplicateInstance::DuplicateInstance(const std::string &instance_id)
    : BusError(fmt::format("instance id '{}' is already in use", instance_id))
{
}

UnknownMode::UnknownMode(const std::string &mode_name)
    : BusError(fmt::format("mode '{}' is not defined", mode_name))
{
}

ModeInheritanceCycle::ModeInheritanceCycle(const std::vector<std::string> &chain)
    : BusError(fmt::format("mode inheritance cycle: {}", fmt::join(chain, " -> ")))
{
}

} // namespace nodebus::ipc
