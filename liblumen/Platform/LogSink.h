#pragma once

#include <liblumen/Platform/ILogSink.h>
#include <liblumen/Platform/LogLevel.h>

namespace lum
{
    // base class for sinks that keep their own level threshold
    //
    // concrete sinks only implement `impl_sink_message`
    class LogSink : public ILogSink {
    protected:
        explicit LogSink(LogLevel threshold = LogLevel::trace) :
            threshold_{threshold}
        {}

    private:
        LogLevel impl_level() const final { return threshold_; }
        void impl_set_level(LogLevel threshold) final { threshold_ = threshold; }

        LogLevel threshold_;
    };
}
