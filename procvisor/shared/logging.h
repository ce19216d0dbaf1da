#pragma once
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>

#include "string_util.h"

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

inline bool parse_log_level(std::string_view str, log_level& level)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("debug"):   level = log_debug; return true;
        case fnv1a("info"):    level = log_info;  return true;
        case fnv1a("warn"):
        case fnv1a("warning"): level = log_warn;  return true;
        case fnv1a("error"):   level = log_error; return true;
        default: return false;
    }
}

struct logger
{
    static inline log_level g_level = log_info;

    // Mirror every line into a file in addition to stderr. Passing an empty
    // path closes the current sink.
    static bool open_file(const std::string& path)
    {
        std::lock_guard<std::mutex> lock(mutex());
        if (s_file)
        {
            std::fclose(s_file);
            s_file = nullptr;
        }
        if (path.empty())
            return true;

        s_file = std::fopen(path.c_str(), "ae");
        return s_file != nullptr;
    }

    static void close_file() { open_file({}); }

    static void log(log_level level, std::string_view msg)
    {
        if (level < g_level)
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        const char* tag;
        switch (level)
        {
            case log_debug: tag = "DEBUG"; break;
            case log_info:  tag = "INFO";  break;
            case log_warn:  tag = "WARN";  break;
            case log_error: tag = "ERROR"; break;
            default:        tag = "?";     break;
        }

        std::lock_guard<std::mutex> lock(mutex());
        std::fprintf(stderr, "[%02d:%02d:%02d] [%s] %.*s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, tag,
            static_cast<int>(msg.size()), msg.data());

        if (s_file)
        {
            std::fprintf(s_file, "%04d-%02d-%02d %02d:%02d:%02d [%s] %.*s\n",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, tag,
                static_cast<int>(msg.size()), msg.data());
            std::fflush(s_file);
        }
    }

private:
    static std::mutex& mutex()
    {
        static std::mutex mtx;
        return mtx;
    }

    static inline std::FILE* s_file = nullptr;
};

#define LOG_DEBUG(msg) do { if (logger::g_level <= log_debug) logger::log(log_debug, msg); } while(0)
#define LOG_INFO(msg)  do { if (logger::g_level <= log_info)  logger::log(log_info,  msg); } while(0)
#define LOG_WARN(msg)  do { if (logger::g_level <= log_warn)  logger::log(log_warn,  msg); } while(0)
#define LOG_ERROR(msg) do { if (logger::g_level <= log_error) logger::log(log_error, msg); } while(0)
