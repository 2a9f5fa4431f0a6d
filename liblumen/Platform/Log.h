#pragma once

#include <liblumen/Platform/LogLevel.h>
#include <liblumen/Platform/Logger.h>

#include <memory>

// log: global logging API
//
// all of `liblumen` logs through the global default logger, which writes to
// `stderr` by default. Applications (and tests) can attach their own sinks
// to it via `global_default_logger()->sinks()`.
namespace lum
{
    std::shared_ptr<Logger> global_default_logger();
    Logger* global_default_logger_raw();

    template<typename... Args>
    void log_message(LogLevel level, const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->log_message(level, fmt, args...);
    }

    template<typename... Args>
    void log_trace(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->trace(fmt, args...);
    }

    template<typename... Args>
    void log_debug(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->debug(fmt, args...);
    }

    template<typename... Args>
    void log_info(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->info(fmt, args...);
    }

    template<typename... Args>
    void log_warn(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->warn(fmt, args...);
    }

    template<typename... Args>
    void log_error(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->error(fmt, args...);
    }

    template<typename... Args>
    void log_critical(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->critical(fmt, args...);
    }
}
