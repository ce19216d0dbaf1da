#pragma once
#include <string>
#include <chrono>
#include <cstdio>
#include <ctime>

inline std::string format_duration(std::chrono::seconds duration)
{
    auto secs = duration.count();
    if (secs < 0)
        secs = 0;

    if (secs < 60)
        return std::to_string(secs) + "s";

    if (secs < 3600)
        return std::to_string(secs / 60) + "m " + std::to_string(secs % 60) + "s";

    return std::to_string(secs / 3600) + "h " + std::to_string((secs % 3600) / 60) + "m";
}

// Sub-minute durations keep one decimal ("12.4s"), used for agent run times.
inline std::string format_duration_precise(double secs)
{
    if (secs < 60.0)
    {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", secs < 0.0 ? 0.0 : secs);
        return buf;
    }
    return format_duration(std::chrono::seconds(static_cast<long long>(secs)));
}

inline std::string format_elapsed(std::chrono::system_clock::time_point start,
                                  std::chrono::system_clock::time_point end)
{
    return format_duration(std::chrono::duration_cast<std::chrono::seconds>(end - start));
}

inline std::string format_local_time(std::chrono::system_clock::time_point tp, const char* fmt)
{
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

inline std::string iso_timestamp(std::chrono::system_clock::time_point tp)
{
    return format_local_time(tp, "%Y-%m-%dT%H:%M:%S");
}

// Prefix for log file names: 20261019_142501
inline std::string file_timestamp(std::chrono::system_clock::time_point tp)
{
    return format_local_time(tp, "%Y%m%d_%H%M%S");
}
