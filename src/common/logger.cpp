#include "common/logger.hpp"
#include <atomic>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace logger
{
    namespace
    {
        std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
        std::mutex g_write_lock;

        const char *level_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Debug:   return "debug";
            case LogLevel::Info:    return "info";
            case LogLevel::Warning: return "warning";
            case LogLevel::Error:   return "error";
            default:                return "unknow";
            }
        }

        // 只保留文件名，去掉目录
        const char *file_name(const char *path)
        {
            const char *p = path;
            for (const char *c = path; *c; ++c)
            {
                if (*c == '/' || *c == '\\')
                    p = c + 1;
            }
            return p;
        }
    }

    void set_log_level(LogLevel level)
    {
        g_level = static_cast<int>(level);
    }

    LogLevel get_log_level()
    {
        return static_cast<LogLevel>(g_level.load());
    }

    LogLevel log_level_from_string(const std::string &name)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "error")   return LogLevel::Error;
        if (lower == "warning" || lower == "warn") return LogLevel::Warning;
        if (lower == "debug")   return LogLevel::Debug;
        return LogLevel::Info;
    }

    void __log_func(const char *file, int line, LogLevel level, const char *fmt, ...)
    {
        if (static_cast<int>(level) > g_level.load())
            return;

        char buffer[2048];
        va_list vl;
        va_start(vl, fmt);
        std::vsnprintf(buffer, sizeof(buffer), fmt, vl);
        va_end(vl);

        std::time_t now = std::time(nullptr);
        std::tm tm_now{};
        localtime_r(&now, &tm_now);
        char time_str[32];
        std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm_now);

        // warning 和 error 走 stderr
        FILE *out = (level <= LogLevel::Warning) ? stderr : stdout;
        std::lock_guard<std::mutex> lock(g_write_lock);
        std::fprintf(out, "[%s][%s][%s:%d]: %s\n", time_str, level_string(level), file_name(file), line, buffer);
        std::fflush(out);
    }

} // namespace logger
