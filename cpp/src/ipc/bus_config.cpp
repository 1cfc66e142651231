#include "nb_service.hpp"

#include "ipc/bus_config.hpp"

#include <fstream>
#include <stdexcept>

namespace nodebus::ipc
{

namespace
{
[[noreturn]] void config_error(const std::string &what)
{
    throw std::runtime_error("nodebus config: " + what);
}
} // namespace

BusConfig BusConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        config_error("top level must be a JSON object");
    }

    BusConfig cfg;
    try
    {
        if (j.contains("bus"))
        {
            const auto &b = j.at("bus");
            if (!b.is_object())
            {
                config_error("'bus' must be an object");
            }
            if (b.contains("domain"))
            {
                const auto name = b.at("domain").get<std::string>();
                auto domain = domain_from_string(name);
                if (!domain)
                {
                    config_error(fmt::format("bus.domain: unknown domain '{}'", name));
                }
                cfg.local_domain = *domain;
            }
            if (b.contains("wait_timeout_ms"))
            {
                const auto ms = b.at("wait_timeout_ms").get<std::int64_t>();
                if (ms < 0)
                {
                    config_error("bus.wait_timeout_ms must not be negative");
                }
                cfg.wait_timeout = std::chrono::milliseconds(ms);
            }
            if (b.contains("error_history"))
            {
                cfg.error_history = b.at("error_history").get<std::size_t>();
            }
            if (b.contains("log_level"))
            {
                const auto level = b.at("log_level").get<std::string>();
                if (!utils::Logger::parse_level(level))
                {
                    config_error(fmt::format("bus.log_level: unknown level '{}'", level));
                }
                cfg.log_level = level;
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        config_error(fmt::format("'bus': {}", e.what()));
    }

    if (j.contains("modes"))
    {
        const auto &modes = j.at("modes");
        if (!modes.is_object())
        {
            config_error("'modes' must be an object");
        }
        for (const auto &[name, mode] : modes.items())
        {
            cfg.modes.insert_or_assign(name, ModeConfig::from_json(mode, name));
        }
    }

    if (j.contains("initial_mode"))
    {
        const auto &initial = j.at("initial_mode");
        if (!initial.is_string())
        {
            config_error("'initial_mode' must be a string");
        }
        cfg.initial_mode = initial.get<std::string>();
        if (cfg.modes.find(*cfg.initial_mode) == cfg.modes.end())
        {
            config_error(fmt::format("initial_mode '{}' is not among the configured modes",
                                     *cfg.initial_mode));
        }
    }
    return cfg;
}

BusConfig BusConfig::from_json_file(const std::filesystem::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        config_error(fmt::format("cannot open '{}'", path.string()));
    }
    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        config_error(fmt::format("'{}': {}", path.string(), e.what()));
    }
    LOGGER_DEBUG("[nodebus/config] loaded '{}'", path.string());
    return from_json(j);
}

} // namespace nodebus::ipc
