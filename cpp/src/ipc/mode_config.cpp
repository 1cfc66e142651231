#include "ipc/mode_config.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace nodebus::ipc
{

namespace
{
[[noreturn]] void config_error(std::string_view mode_name, const std::string &what)
{
    throw std::runtime_error(fmt::format("nodebus config: mode '{}': {}", mode_name, what));
}

std::vector<std::string> string_list(const nlohmann::json &j, std::string_view mode_name,
                                     const std::string &key)
{
    if (!j.is_array())
    {
        config_error(mode_name, fmt::format("'{}' must be an array of strings", key));
    }
    std::vector<std::string> out;
    out.reserve(j.size());
    for (const auto &item : j)
    {
        if (!item.is_string())
        {
            config_error(mode_name, fmt::format("'{}' contains a non-string entry", key));
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}
} // namespace

ModeConfig ModeConfig::from_json(const nlohmann::json &j, std::string_view mode_name)
{
    if (!j.is_object())
    {
        config_error(mode_name, "definition must be a JSON object");
    }

    ModeConfig cfg;
    if (auto it = j.find("base"); it != j.end() && !it->is_null())
    {
        if (!it->is_string())
        {
            config_error(mode_name, "'base' must be a string");
        }
        cfg.base = it->get<std::string>();
    }
    if (auto it = j.find("nodes"); it != j.end())
    {
        cfg.nodes = string_list(*it, mode_name, "nodes");
    }
    if (auto it = j.find("wiring"); it != j.end())
    {
        if (!it->is_object())
        {
            config_error(mode_name, "'wiring' must be an object");
        }
        for (const auto &[source, targets] : it->items())
        {
            cfg.wiring[source] = string_list(targets, mode_name, "wiring." + source);
        }
    }
    if (auto it = j.find("attributes"); it != j.end())
    {
        if (!it->is_object())
        {
            config_error(mode_name, "'attributes' must be an object");
        }
        for (const auto &[cls, attrs] : it->items())
        {
            if (!attrs.is_object())
            {
                config_error(mode_name, fmt::format("'attributes.{}' must be an object", cls));
            }
            cfg.attributes[cls] = attrs;
        }
    }
    return cfg;
}

nlohmann::json ModeConfig::to_json() const
{
    nlohmann::json j = nlohmann::json::object();
    if (base)
    {
        j["base"] = *base;
    }
    j["nodes"] = nodes;
    j["wiring"] = nlohmann::json::object();
    for (const auto &[source, targets] : wiring)
    {
        j["wiring"][source] = targets;
    }
    j["attributes"] = nlohmann::json::object();
    for (const auto &[cls, attrs] : attributes)
    {
        j["attributes"][cls] = attrs;
    }
    return j;
}

} // namespace nodebus::ipc
