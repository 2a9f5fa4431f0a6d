#include "ScopeExit.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace lum;

TEST(ScopeExit, calls_exit_function_when_scope_exits_normally)
{
    int num_calls = 0;
    {
        const ScopeExit guard{[&num_calls]() { ++num_calls; }};
        ASSERT_EQ(num_calls, 0);
    }
    ASSERT_EQ(num_calls, 1);
}

TEST(ScopeExit, calls_exit_function_when_scope_exits_via_exception)
{
    int num_calls = 0;
    try {
        const ScopeExit guard{[&num_calls]() { ++num_calls; }};
        throw std::runtime_error{"boom"};
    }
    catch (const std::runtime_error&) {
        ASSERT_EQ(num_calls, 1);
    }
    ASSERT_EQ(num_calls, 1);
}

TEST(ScopeExit, accepts_a_named_callback)
{
    int num_calls = 0;
    const auto increment = [&num_calls]() { ++num_calls; };
    {
        const ScopeExit guard{increment};
    }
    ASSERT_EQ(num_calls, 1);
}
