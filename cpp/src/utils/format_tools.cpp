// format_tools.cpp
#include "nb_base.hpp"

namespace nodebus::format_tools
{

// Formatted local time with microsecond resolution. The fractional part is computed
// separately so the result does not depend on fmt's chrono sub-second support.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(secs)));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string_view trim(std::string_view input) noexcept
{
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = input.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = input.find_last_not_of(kWhitespace);
    return input.substr(first, last - first + 1);
}

} // namespace nodebus::format_tools
