#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "nodebus_utils_export.h"

namespace nodebus::utils
{

// Represents a single log message event.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int keeps this header independent of logger.hpp
    fmt::memory_buffer body;
};

// Abstract interface for a log message destination. Only the logger worker thread
// calls into a sink.
class NODEBUS_UTILS_EXPORT Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string(int lvl) noexcept;
    static std::string format_logmsg(const LogMessage &msg);
};

} // namespace nodebus::utils
