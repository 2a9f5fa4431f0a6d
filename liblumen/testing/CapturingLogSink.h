#pragma once

#include <liblumen/Platform/Log.h>
#include <liblumen/Platform/LogLevel.h>
#include <liblumen/Platform/LogMessage.h>
#include <liblumen/Platform/LogSink.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace lum::testing
{
    // a log sink that keeps a copy of every message it receives
    class CapturingLogSink final : public LogSink {
    public:
        const std::vector<OwnedLogMessage>& messages() const { return messages_; }

        bool contains(LogLevel level, std::string_view payload) const
        {
            return std::ranges::any_of(messages_, [level, payload](const OwnedLogMessage& m)
            {
                return m.level == level and m.payload == payload;
            });
        }

        bool contains_at_level(LogLevel level) const
        {
            return std::ranges::any_of(messages_, [level](const OwnedLogMessage& m) { return m.level == level; });
        }

    private:
        void impl_sink_message(const LogMessageView& view) final
        {
            messages_.emplace_back(view);
        }

        std::vector<OwnedLogMessage> messages_;
    };

    // attaches a sink to the global default logger for the lifetime of the attachment
    class ScopedLogSinkAttachment final {
    public:
        explicit ScopedLogSinkAttachment(std::shared_ptr<ILogSink> sink) :
            sink_{std::move(sink)}
        {
            global_default_logger()->sinks().push_back(sink_);
        }
        ScopedLogSinkAttachment(const ScopedLogSinkAttachment&) = delete;
        ScopedLogSinkAttachment(ScopedLogSinkAttachment&&) noexcept = delete;
        ScopedLogSinkAttachment& operator=(const ScopedLogSinkAttachment&) = delete;
        ScopedLogSinkAttachment& operator=(ScopedLogSinkAttachment&&) noexcept = delete;
        ~ScopedLogSinkAttachment() noexcept
        {
            std::erase(global_default_logger()->sinks(), sink_);
        }

    private:
        std::shared_ptr<ILogSink> sink_;
    };
}
