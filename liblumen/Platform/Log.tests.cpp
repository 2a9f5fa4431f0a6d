#include "Log.h"

#include <liblumen/testing/CapturingLogSink.h>

#include <gtest/gtest.h>

#include <memory>

using namespace lum;
using namespace lum::testing;

TEST(Logger, forwards_formatted_message_to_sink)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};

    logger.info("hello %s, the answer is %i", "world", 42);

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().payload, "hello world, the answer is 42");
    ASSERT_EQ(sink->messages().front().logger_name, "test");
    ASSERT_EQ(sink->messages().front().level, LogLevel::info);
}

TEST(Logger, does_not_forward_messages_below_logger_level)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};
    logger.set_level(LogLevel::warn);

    logger.info("should be dropped");
    logger.warn("should be kept");

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().payload, "should be kept");
}

TEST(Logger, does_not_forward_messages_below_sink_level)
{
    auto sink = std::make_shared<CapturingLogSink>();
    sink->set_level(LogLevel::err);
    Logger logger{"test", sink};

    logger.warn("should be dropped");
    logger.error("should be kept");

    ASSERT_EQ(sink->messages().size(), 1);
    ASSERT_EQ(sink->messages().front().level, LogLevel::err);
}

TEST(global_default_logger, can_attach_a_sink_to_it)
{
    auto sink = std::make_shared<CapturingLogSink>();
    const ScopedLogSinkAttachment attachment{sink};

    log_warn("from the global logger: %zu", static_cast<size_t>(7));

    ASSERT_TRUE(sink->contains(LogLevel::warn, "from the global logger: 7"));
}

TEST(global_default_logger, its_stderr_sink_only_shows_messages_at_or_above_the_default_level)
{
    const auto& sinks = global_default_logger()->sinks();

    ASSERT_FALSE(sinks.empty());
    ASSERT_EQ(sinks.front()->level(), LogLevel::DEFAULT);
    ASSERT_FALSE(sinks.front()->should_log(LogLevel::debug));
}

TEST(LogSink, derived_sinks_accept_every_level_by_default)
{
    CapturingLogSink sink;

    ASSERT_EQ(sink.level(), LogLevel::trace);
    ASSERT_TRUE(sink.should_log(LogLevel::trace));
}
