#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace slidelink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // link lifecycle milestones, always shown
};

inline Level &global_level()
{
    static Level lv = Level::Debug;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline void set_log_level_by_name(const char *name)
{
    std::string level = std::string(name);
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

inline void set_log_level_from_env(const char *key = "SLIDELINK_LOG_LEVEL")
{
    if (const char *v = std::getenv(key); v && *v)
        set_log_level_by_name(v);
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
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

// Render up to max_bytes of a payload as "0a 1b ..", for notify/debug logs.
inline std::string hex_bytes(const unsigned char *data, size_t len, size_t max_bytes = 16)
{
    static const char digits[] = "0123456789abcdef";
    std::string       out;
    const size_t      n = len < max_bytes ? len : max_bytes;
    out.reserve(n * 3 + 4);
    for (size_t i = 0; i < n; ++i)
    {
        if (i)
            out.push_back(' ');
        out.push_back(digits[(data[i] >> 4) & 0x0F]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    if (len > n)
        out += " ..";
    return out;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::slidelink::logf(::slidelink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::slidelink::logf(::slidelink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::slidelink::logf(::slidelink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::slidelink::logf(::slidelink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::slidelink::logf(::slidelink::Level::System, __func__, __VA_ARGS__)

}  // namespace slidelink
