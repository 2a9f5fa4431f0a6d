#include "Assertions.h"

#include <liblumen/Platform/LogLevel.h>
#include <liblumen/testing/CapturingLogSink.h>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace lum;
using namespace lum::testing;

TEST(LUM_ASSERT_ALWAYS, does_nothing_when_expression_is_true)
{
    ASSERT_NO_THROW({ LUM_ASSERT_ALWAYS(1 + 1 == 2); });
}

TEST(LUM_ASSERT_ALWAYS, throws_runtime_error_when_expression_is_false)
{
    ASSERT_THROW({ LUM_ASSERT_ALWAYS(1 + 1 == 3); }, std::runtime_error);
}

TEST(LUM_ASSERT_ALWAYS, error_message_contains_failing_code_and_filename)
{
    try {
        LUM_ASSERT_ALWAYS(false && "some reason");
        FAIL() << "should have thrown";
    }
    catch (const std::runtime_error& ex) {
        const std::string msg = ex.what();
        ASSERT_NE(msg.find("some reason"), std::string::npos);
        ASSERT_NE(msg.find("Assertions.tests.cpp"), std::string::npos);
    }
}

TEST(LUM_ASSERT_ALWAYS, logs_the_failure_at_critical_level)
{
    auto sink = std::make_shared<CapturingLogSink>();
    const ScopedLogSinkAttachment attachment{sink};

    ASSERT_THROW({ LUM_ASSERT_ALWAYS(false && "logged reason"); }, std::runtime_error);
    ASSERT_TRUE(sink->contains_at_level(LogLevel::critical));
}
