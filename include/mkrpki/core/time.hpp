#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <mkrpki/core/result.hpp>

namespace mkrpki {

    // Whole seconds since the epoch. Every encoded time has second precision.
    using Time = std::chrono::sys_seconds;

    // Bounds of a four-digit GeneralizedTime year.
    inline constexpr Time earliest_time() {
        using namespace std::chrono;
        return sys_days{year{0} / January / 1};
    }

    inline constexpr Time latest_time() {
        using namespace std::chrono;
        return sys_days{year{9999} / December / 31} + hours{23} + minutes{59} + seconds{59};
    }

    // Parses an RFC 3339 timestamp such as "2024-01-01T00:00:00Z" or "2024-01-01T02:00:00.5+02:00".
    Result<Time> parse_time(std::string_view text);

    std::string format_time(Time tp);

    template <typename Duration>
    inline Time truncate_to_seconds(std::chrono::time_point<std::chrono::system_clock, Duration> tp) {
        return std::chrono::floor<std::chrono::seconds>(tp);
    }

    inline Time now() { return truncate_to_seconds(std::chrono::system_clock::now()); }

} // namespace mkrpki
