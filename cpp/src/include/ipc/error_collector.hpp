#pragma once
/**
 * @file error_collector.hpp
 * @brief The single destination for handler failures and routing anomalies.
 *
 * `handle_error()` never throws and never blocks on telemetry: every event is
 * logged, kept in a bounded history, and handed to the registered sinks on a
 * CallbackDispatcher thread.
 */
#include "ipc/node_types.hpp"
#include "nodebus_utils_export.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace nodebus::utils
{
class CallbackDispatcher;
}

namespace nodebus::ipc
{

struct NODEBUS_UTILS_EXPORT ErrorEvent
{
    std::string node_id;
    std::string class_name;
    std::string handler; ///< e.g. "In.onHit", or "<router>" for routing anomalies
    std::string error;
    Payload data;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    /// Keys: node, class, handler, error, data, timestamp.
    [[nodiscard]] nlohmann::json to_json() const;
};

/// External telemetry backend. Called off the bus thread, one event at a time.
class NODEBUS_UTILS_EXPORT TelemetrySink
{
  public:
    virtual ~TelemetrySink() = default;
    virtual void record(const ErrorEvent &event) = 0;
};

class NODEBUS_UTILS_EXPORT ErrorCollector
{
  public:
    static constexpr std::size_t kDefaultHistory = 256;

    explicit ErrorCollector(std::size_t history_limit = kDefaultHistory);
    ~ErrorCollector();

    ErrorCollector(const ErrorCollector &) = delete;
    ErrorCollector &operator=(const ErrorCollector &) = delete;

    void handle_error(ErrorEvent event) noexcept;

    void add_sink(std::shared_ptr<TelemetrySink> sink);

    /// Oldest first.
    [[nodiscard]] std::vector<ErrorEvent> recent() const;
    [[nodiscard]] std::uint64_t total_count() const;

    /// Blocks until every event handed to the sinks so far has been recorded.
    void flush();

    /// Drops the history and the count. Sinks stay registered.
    void clear();

  private:
    std::size_t m_history_limit;
    mutable std::mutex m_mutex;
    std::deque<ErrorEvent> m_history;
    std::uint64_t m_total{0};
    std::vector<std::shared_ptr<TelemetrySink>> m_sinks;
    std::unique_ptr<utils::CallbackDispatcher> m_dispatcher;
};

} // namespace nodebus::ipc

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
