#pragma once
/**
 * @file node_class.hpp
 * @brief Node class definitions and their flattened, immutable runtime form.
 *
 * A `NodeClassDef` is the builder an application fills in. `ClassRegistry::define`
 * turns it into a `NodeClass`: the whole extension chain is flattened once, so
 * handler lookup never walks parent classes at dispatch time.
 *
 * **Handler resolution order** (`NodeClass::resolve_handler`)
 * 1. mode override for each mode of the active chain, most derived mode first
 * 2. concrete handler
 * 3. default handler
 *
 * @code
 * bus.define_class(NodeClassDef("Turret")
 *                      .extends("Damageable")
 *                      .domain(Domain::Server)
 *                      .on(Channel::Input, "onHit", [](NodeInstance &self, const Message &msg) {
 *                          self.set_attribute("hp", self.attribute_or<int>("hp", 0) - 1);
 *                      })
 *                      .output("destroyed"));
 * @endcode
 */
#include "ipc/bus_errors.hpp"
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"
#include "utils/result.hpp"

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::ipc
{

class NodeInstance;

using Handler = std::function<void(NodeInstance &self, const Message &msg)>;

using ChannelHandlers = std::map<std::string, Handler, std::less<>>;
using HandlerTable = std::array<ChannelHandlers, kChannelCount>;

/// A required (channel, handler) pair and the class that demanded it.
struct RequiredHandler
{
    Channel channel;
    std::string handler;
    std::string required_by;
};

class NODEBUS_UTILS_EXPORT NodeClassDef
{
  public:
    explicit NodeClassDef(std::string name);

    /// Parent class; it must already be registered. Defaults to the root "Node".
    NodeClassDef &extends(std::string parent);
    /// Defaults to the parent's domain.
    NodeClassDef &domain(Domain domain);
    NodeClassDef &require(Channel channel, std::string handler);
    NodeClassDef &on(Channel channel, std::string handler, Handler fn);
    /// Fallback used when neither a mode override nor a concrete handler exists.
    NodeClassDef &on_default(Channel channel, std::string handler, Handler fn);
    /// Handler used only while `mode` (or a mode based on it) is active.
    NodeClassDef &on_mode(std::string mode, Channel channel, std::string handler, Handler fn);
    NodeClassDef &output(std::string signal);
    /// Routes `signal` to `handler` instead of the default "on<Signal>" name.
    NodeClassDef &map_signal(std::string signal, std::string handler,
                             Channel channel = Channel::Input);
    NodeClassDef &attribute(std::string key, Payload value);
    /// Abstract classes may leave requirements to their descendants and cannot be
    /// instantiated.
    NodeClassDef &abstract_class(bool is_abstract = true);

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }

  private:
    friend class ClassRegistry;

    std::string m_name;
    std::optional<std::string> m_parent;
    std::optional<Domain> m_domain;
    std::vector<std::pair<Channel, std::string>> m_required;
    HandlerTable m_handlers;
    HandlerTable m_defaults;
    std::map<std::string, HandlerTable, std::less<>> m_mode_handlers;
    std::vector<std::string> m_outputs;
    std::array<std::map<std::string, std::string, std::less<>>, kChannelCount> m_signal_map;
    Payload m_attributes = Payload::object();
    bool m_abstract{false};
};

class NODEBUS_UTILS_EXPORT NodeClass
{
  public:
    /// Only the registry can build classes.
    class Passkey
    {
        friend class ClassRegistry;
        Passkey() = default;
    };

    explicit NodeClass(Passkey) {}

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    [[nodiscard]] Domain domain() const noexcept { return m_domain; }
    [[nodiscard]] bool is_abstract() const noexcept { return m_abstract; }

    /// [self, parent, ..., "Node"].
    [[nodiscard]] const std::vector<std::string> &lineage() const noexcept { return m_lineage; }
    [[nodiscard]] bool is_a(std::string_view class_name) const noexcept;

    [[nodiscard]] const std::vector<RequiredHandler> &required() const noexcept
    {
        return m_required;
    }

    /// True if a concrete or default handler exists (mode overrides do not count).
    [[nodiscard]] bool has_handler(Channel channel, std::string_view handler) const noexcept;

    [[nodiscard]] utils::Result<const Handler *, ResolveError>
    resolve_handler(Channel channel, std::string_view handler,
                    const std::vector<std::string> &mode_chain) const;

    /// Handler name for an incoming signal, from the table built at registration.
    [[nodiscard]] std::optional<std::string> handler_for_signal(Channel channel,
                                                                std::string_view signal) const;

    [[nodiscard]] const std::vector<std::string> &outputs() const noexcept { return m_outputs; }
    [[nodiscard]] const Payload &default_attributes() const noexcept { return m_attributes; }

  private:
    friend class ClassRegistry;

    std::string m_name;
    Domain m_domain{Domain::Shared};
    bool m_abstract{false};
    std::vector<std::string> m_lineage;
    std::vector<RequiredHandler> m_required;
    HandlerTable m_handlers;
    HandlerTable m_defaults;
    std::map<std::string, HandlerTable, std::less<>> m_mode_handlers;
    std::array<std::map<std::string, std::string, std::less<>>, kChannelCount> m_signal_table;
    std::vector<std::string> m_outputs;
    Payload m_attributes = Payload::object();
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
