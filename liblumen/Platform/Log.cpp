#include "Log.h"

#include <liblumen/Platform/LogMessage.h>
#include <liblumen/Platform/LogSink.h>

#include <algorithm>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

using namespace lum;

namespace
{
    class StderrSink final : public LogSink {
    public:
        StderrSink() : LogSink{LogLevel::DEFAULT} {}

    private:
        void impl_sink_message(const LogMessageView& msg) final
        {
            const std::lock_guard guard{mutex_};
            std::cerr << '[' << msg.logger_name << "] [" << msg.level << "] " << msg.payload << std::endl;
        }

        std::mutex mutex_;
    };

    struct GlobalSinks final {
        GlobalSinks() :
            default_logger{std::make_shared<Logger>("lumen", std::make_shared<StderrSink>())}
        {}

        std::shared_ptr<Logger> default_logger;
    };

    GlobalSinks& get_global_sinks()
    {
        static GlobalSinks s_global_sinks;
        return s_global_sinks;
    }
}

void lum::Logger::log_message(LogLevel level, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    vlog_message(level, fmt, args);
    va_end(args);
}

void lum::Logger::vlog_message(LogLevel level, const char* fmt, va_list args)
{
    if (level < level_) {
        return;
    }

    // create the log message
    thread_local std::vector<char> buf(2048);
    const int rv = std::vsnprintf(buf.data(), buf.size(), fmt, args);
    if (rv <= 0) {
        return;
    }
    const size_t n = std::min(static_cast<size_t>(rv), buf.size()-1);
    const LogMessageView msg{name_, std::string_view{buf.data(), n}, level};

    // sink it
    for (auto& sink : sinks_) {
        if (sink->should_log(msg.level)) {
            sink->sink_message(msg);
        }
    }
}

std::shared_ptr<Logger> lum::global_default_logger()
{
    return get_global_sinks().default_logger;
}

Logger* lum::global_default_logger_raw()
{
    return get_global_sinks().default_logger.get();
}
