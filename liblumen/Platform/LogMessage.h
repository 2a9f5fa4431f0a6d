#pragma once

#include <liblumen/Platform/LogLevel.h>

#include <chrono>
#include <string>
#include <string_view>

namespace lum
{
    // a log message
    //
    // to prevent needless runtime allocations, this does not own its data. See
    // `OwnedLogMessage` if you need an owning version
    struct LogMessageView final {
        LogMessageView() = default;

        LogMessageView(
            std::string_view logger_name,
            std::string_view payload,
            LogLevel level) :

            logger_name{logger_name},
            time{std::chrono::system_clock::now()},
            payload{payload},
            level{level}
        {}

        std::string_view logger_name;
        std::chrono::system_clock::time_point time;
        std::string_view payload;
        LogLevel level = LogLevel::DEFAULT;
    };

    // a log message that owns all its data
    //
    // useful if you need to persist a log message somewhere
    struct OwnedLogMessage final {
        OwnedLogMessage() = default;

        explicit OwnedLogMessage(const LogMessageView& view) :
            logger_name{view.logger_name},
            time{view.time},
            payload{view.payload},
            level{view.level}
        {}

        std::string logger_name;
        std::chrono::system_clock::time_point time;
        std::string payload;
        LogLevel level = LogLevel::DEFAULT;
    };
}
