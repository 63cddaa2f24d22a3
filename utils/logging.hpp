// utils/logging.hpp
#pragma once
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

namespace utils
{

    enum class LogLevel : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    inline const char *to_string(LogLevel lvl)
    {
        switch (lvl)
        {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
        }
        return "OFF";
    }

    // Accepts "trace", "debug", "info", "warn"/"warning", "error", "off" in any case.
    // Returns false (and leaves out untouched) for anything else.
    inline bool parse_level(const std::string &name, LogLevel &out)
    {
        std::string v;
        v.reserve(name.size());
        for (char c : name)
            v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (v == "trace")
            out = LogLevel::Trace;
        else if (v == "debug")
            out = LogLevel::Debug;
        else if (v == "info")
            out = LogLevel::Info;
        else if (v == "warn" || v == "warning")
            out = LogLevel::Warn;
        else if (v == "error")
            out = LogLevel::Error;
        else if (v == "off")
            out = LogLevel::Off;
        else
            return false;
        return true;
    }

    // Global state
    inline LogLevel &global_level()
    {
        static LogLevel lvl = LogLevel::Info;
        return lvl;
    }

    inline std::ofstream &global_log_file()
    {
        static std::ofstream log_file;
        return log_file;
    }

    // Planning and tactical loops log from different threads; one line at a time.
    inline std::mutex &log_mutex()
    {
        static std::mutex m;
        return m;
    }

    inline void set_level(LogLevel lvl)
    {
        global_level() = lvl;
    }

    inline bool open_log_file(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        auto &f = global_log_file();
        if (f.is_open())
        {
            f.close();
        }

        f.open(path, std::ios::out | std::ios::app);
        if (!f.is_open())
        {
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }

        std::fprintf(stderr, "[INFO] Logging to file: %s\n", path.c_str());
        return true;
    }

    inline void close_log_file()
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        auto &f = global_log_file();
        if (f.is_open())
        {
            f.close();
        }
    }

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (lvl < global_level() || global_level() == LogLevel::Off)
            return;

        std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);

        char ts[32];
        std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        char log_line[1200];
        std::snprintf(log_line, sizeof(log_line), "[%s] %-5s: %s\n", ts, to_string(lvl), msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::fprintf(stderr, "%s", log_line);

        auto &f = global_log_file();
        if (f.is_open())
        {
            f << log_line;
            f.flush();
        }
    }

    inline void logf(LogLevel lvl, const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        vlogf(lvl, fmt, args);
        va_end(args);
    }

} // namespace utils

// Convenience macros
#define LOG_TRACE(...) ::utils::logf(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::utils::logf(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::utils::logf(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::utils::logf(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::utils::logf(::utils::LogLevel::Error, __VA_ARGS__)
