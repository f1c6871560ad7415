#ifndef LOGGER_HPP__
#define LOGGER_HPP__

#include <cstdio>
#include <string>

namespace logger
{
    enum class LogLevel : int
    {
        Error   = 0,
        Warning = 1,
        Info    = 2,
        Debug   = 3
    };

    void set_log_level(LogLevel level);
    LogLevel get_log_level();

    // "error" / "warning" / "info" / "debug"，无法识别时返回 Info
    LogLevel log_level_from_string(const std::string &name);

    void __log_func(const char *file, int line, LogLevel level, const char *fmt, ...);

} // namespace logger

#define INFOD(...) ::logger::__log_func(__FILE__, __LINE__, ::logger::LogLevel::Debug, __VA_ARGS__)
#define INFO(...)  ::logger::__log_func(__FILE__, __LINE__, ::logger::LogLevel::Info, __VA_ARGS__)
#define INFOW(...) ::logger::__log_func(__FILE__, __LINE__, ::logger::LogLevel::Warning, __VA_ARGS__)
#define INFOE(...) ::logger::__log_func(__FILE__, __LINE__, ::logger::LogLevel::Error, __VA_ARGS__)

#endif // LOGGER_HPP__
