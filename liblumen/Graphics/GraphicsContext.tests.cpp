#include "GraphicsContext.h"

#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/StateQueryError.h>
#include <liblumen/Platform/LogLevel.h>
#include <liblumen/testing/CapturingLogSink.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>

#include <gtest/gtest.h>

#include <memory>

using namespace lum;
using namespace lum::testing;

TEST(GraphicsContext, throws_StateQueryError_if_the_backend_cannot_report_its_state)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    backend->set_fail_state_query(true);

    ASSERT_THROW({ GraphicsContext context{backend}; }, StateQueryError);
}

TEST(GraphicsContext, logs_the_backends_capabilities_when_created)
{
    auto sink = std::make_shared<CapturingLogSink>();
    const ScopedLogSinkAttachment attachment{sink};

    const GraphicsContext context{std::make_shared<RecordingGraphicsBackend>()};

    ASSERT_TRUE(sink->contains_at_level(LogLevel::info));
}

TEST(GraphicsContext, default_params_use_stream_draw_and_forced_creation_binds)
{
    const GraphicsContextParams params;

    ASSERT_EQ(params.default_buffer_usage, BufferUsage::StreamDraw);
    ASSERT_EQ(params.creation_bind_mode, BindMode::Forced);
}

TEST(GraphicsContext, buffers_use_the_configured_usage_hint)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    GraphicsContext context{backend, GraphicsContextParams{.default_buffer_usage = BufferUsage::StaticDraw}};

    const Buffer<float> buffer = context.new_buffer<float>(4);

    ASSERT_EQ(backend->buffer_usage(buffer.handle()), BufferUsage::StaticDraw);
}

TEST(GraphicsContext, cached_creation_binds_are_elided_when_the_cache_allows_it)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    GraphicsContext context{backend, GraphicsContextParams{.creation_bind_mode = BindMode::Cached}};
    Buffer<float> buffer = context.new_buffer<float>(4);
    backend->clear_calls();

    // the buffer is already bound, so setting an element doesn't rebind it
    buffer.set(0, 1.0f);

    ASSERT_EQ(backend->count(RecordedCallKind::BindBuffer), 0);
}

TEST(GraphicsContext, invalidate_state_forces_rebinds)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    GraphicsContext context{backend};
    Buffer<float> buffer = context.new_buffer<float>(4);
    backend->bind_buffer_behind_the_caches_back(BufferTarget::Array, BufferHandle{});

    context.invalidate_state();
    backend->clear_calls();
    buffer.set(0, 1.0f);

    ASSERT_EQ(backend->count(RecordedCallKind::BindBuffer, BufferTarget::Array), 1);
    ASSERT_EQ(buffer.at(0), 1.0f);
}

TEST(GraphicsContext, resources_share_the_contexts_state)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    GraphicsContext context{backend};

    const Buffer<float> buffer = context.new_buffer<float>(4);

    ASSERT_EQ(&buffer.raw().state(), &context.state());
}
