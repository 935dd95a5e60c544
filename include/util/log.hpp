#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <optional>
#include <string>

namespace tchan
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4,
    Off     = 5  // threshold only, never used for a message
};

struct LogState
{
    Level lv   = Level::Info;
    FILE *sink = nullptr;  // nullptr => stderr
};

inline LogState &log_state()
{
    static LogState st;
    return st;
}

inline void set_log_level(Level lv)
{
    log_state().lv = lv;
}

inline Level log_level()
{
    return log_state().lv;
}

// Redirect output (tools write dumps to stdout and logs elsewhere). nullptr restores stderr.
inline void set_log_sink(FILE *f)
{
    log_state().sink = f;
}

inline bool log_enabled(Level lv)
{
    return (int)lv >= (int)log_state().lv;
}

inline std::optional<Level> parse_level(const char *name)
{
    if (!name)
        return std::nullopt;
    std::string s(name);
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "debug")
        return Level::Debug;
    if (s == "info")
        return Level::Info;
    if (s == "warn" || s == "warning")
        return Level::Warning;
    if (s == "error" || s == "err")
        return Level::Error;
    if (s == "off" || s == "none")
        return Level::Off;
    return std::nullopt;
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    set_log_level(parse_level(name).value_or(Level::Info));
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
        case Level::Off:
            break;
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  us  = duration_cast<microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%06d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)us.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv) || lv == Level::Off)
        return;

    FILE *out = log_state().sink ? log_state().sink : stderr;

    char ts[20];
    timestamp(ts, sizeof(ts));
    std::fprintf(out, "%s tchan %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', out);
}

#define LOG_DEBUG(...) ::tchan::logf(::tchan::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::tchan::logf(::tchan::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::tchan::logf(::tchan::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::tchan::logf(::tchan::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::tchan::logf(::tchan::Level::System, __func__, __VA_ARGS__)

}  // namespace tchan
