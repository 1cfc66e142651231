#include "nb_service.hpp"

#include "ipc/error_collector.hpp"

namespace nodebus::ipc
{

nlohmann::json ErrorEvent::to_json() const
{
    return nlohmann::json{{"node", node_id},
                          {"class", class_name},
                          {"handler", handler},
                          {"error", error},
                          {"data", data},
                          {"timestamp", format_tools::formatted_time(timestamp)}};
}

ErrorCollector::ErrorCollector(std::size_t history_limit)
    : m_history_limit(history_limit),
      m_dispatcher(std::make_unique<utils::CallbackDispatcher>(
          [](const std::string &what)
          { LOGGER_WARN("[nodebus/errors] telemetry sink threw: {}", what); }))
{
}

ErrorCollector::~ErrorCollector()
{
    m_dispatcher->shutdown();
}

void ErrorCollector::handle_error(ErrorEvent event) noexcept
{
    try
    {
        std::vector<std::shared_ptr<TelemetrySink>> sinks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_total;
            m_history.push_back(event);
            while (m_history.size() > m_history_limit)
            {
                m_history.pop_front();
            }
            sinks = m_sinks;
        }

        auto shared_event = std::make_shared<const ErrorEvent>(std::move(event));
        // One task per sink so a throwing sink does not starve the others.
        for (auto &sink : sinks)
        {
            m_dispatcher->post([sink = std::move(sink), shared_event]()
                               { sink->record(*shared_event); });
        }

        // Handler text is arbitrary bytes; invalid UTF-8 must not make the log line throw.
        LOGGER_ERROR("[nodebus/errors] {}",
                     shared_event->to_json().dump(-1, ' ', false,
                                                  nlohmann::json::error_handler_t::replace));
    }
    catch (const std::exception &e)
    {
        NB_DEBUG("ErrorCollector::handle_error failed: {}", e.what());
    }
}

void ErrorCollector::add_sink(std::shared_ptr<TelemetrySink> sink)
{
    if (!sink)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

std::vector<ErrorEvent> ErrorCollector::recent() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_history.begin(), m_history.end()};
}

std::uint64_t ErrorCollector::total_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total;
}

void ErrorCollector::flush()
{
    m_dispatcher->drain();
}

void ErrorCollector::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
    m_total = 0;
}

} // namespace nodebus::ipc
