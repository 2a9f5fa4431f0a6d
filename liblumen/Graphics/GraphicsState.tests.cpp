#include "GraphicsState.h"

#include <liblumen/Graphics/StateQueryError.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>

#include <gtest/gtest.h>

#include <memory>
#include <optional>

using namespace lum;
using namespace lum::testing;

namespace
{
    struct Fixture {
        std::shared_ptr<RecordingGraphicsBackend> backend = std::make_shared<RecordingGraphicsBackend>();
        GraphicsState state{backend};
    };
}

TEST(GraphicsState, throws_StateQueryError_if_backend_cannot_report_its_state)
{
    auto backend = std::make_shared<RecordingGraphicsBackend>();
    backend->set_fail_state_query(true);
    ASSERT_THROW({ GraphicsState state{backend}; }, StateQueryError);
}

TEST(GraphicsState, throws_StateQueryError_if_given_a_null_backend)
{
    ASSERT_THROW({ GraphicsState state{nullptr}; }, StateQueryError);
}

TEST(GraphicsState, throws_StateQueryError_if_backend_reports_zero_vertex_attributes)
{
    GraphicsBackendState initial;
    initial.limits.max_vertex_attributes = 0;
    auto backend = std::make_shared<RecordingGraphicsBackend>(initial);
    ASSERT_THROW({ GraphicsState state{backend}; }, StateQueryError);
}

TEST(GraphicsState, cache_is_initialized_from_the_backends_real_bindings)
{
    GraphicsBackendState initial;
    initial.array_buffer = BufferHandle{7};
    auto backend = std::make_shared<RecordingGraphicsBackend>(initial);
    const GraphicsState state{backend};

    ASSERT_EQ(state.bound_buffer(BufferTarget::Array), BufferHandle{7});
    ASSERT_EQ(state.bound_buffer(BufferTarget::ElementArray), BufferHandle{});
    ASSERT_EQ(state.bound_vertex_array(), VertexArrayHandle{});
}

TEST(GraphicsState, repeated_cached_binds_of_the_same_handle_issue_one_native_call)
{
    Fixture f;
    const BufferHandle h{5};

    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 1);
    ASSERT_EQ(f.state.stats().num_buffer_binds_issued, 1);
    ASSERT_EQ(f.state.stats().num_buffer_binds_elided, 2);
}

TEST(GraphicsState, cached_binds_of_different_handles_each_issue_a_native_call)
{
    Fixture f;

    f.state.bind_buffer(BufferTarget::Array, BufferHandle{5}, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::Array, BufferHandle{6}, BindMode::Cached);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 2);
    ASSERT_EQ(f.state.bound_buffer(BufferTarget::Array), BufferHandle{6});
}

TEST(GraphicsState, forced_binds_always_issue_a_native_call)
{
    Fixture f;
    const BufferHandle h{5};

    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Forced);
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Forced);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 2);
}

TEST(GraphicsState, targets_are_cached_independently)
{
    Fixture f;
    const BufferHandle h{5};

    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::ElementArray, h, BindMode::Cached);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 2);
}

TEST(GraphicsState, unbind_buffer_reverts_every_target_it_is_bound_to)
{
    Fixture f;
    const BufferHandle h{5};
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::ElementArray, BufferHandle{6}, BindMode::Cached);

    f.state.unbind_buffer(h);

    ASSERT_EQ(f.state.bound_buffer(BufferTarget::Array), BufferHandle{});
    ASSERT_EQ(f.backend->actual_bound_buffer(BufferTarget::Array), BufferHandle{});
    ASSERT_EQ(f.state.bound_buffer(BufferTarget::ElementArray), BufferHandle{6});
}

TEST(GraphicsState, unbind_buffer_does_nothing_if_the_handle_is_not_bound)
{
    Fixture f;
    f.state.bind_buffer(BufferTarget::Array, BufferHandle{5}, BindMode::Cached);
    f.backend->clear_calls();

    f.state.unbind_buffer(BufferHandle{6});
    f.state.unbind_buffer(BufferHandle{});

    ASSERT_TRUE(f.backend->calls().empty());
}

TEST(GraphicsState, changing_the_vertex_array_makes_the_element_array_binding_unknown)
{
    Fixture f;
    f.state.bind_buffer(BufferTarget::ElementArray, BufferHandle{5}, BindMode::Cached);
    ASSERT_EQ(f.state.bound_buffer(BufferTarget::ElementArray), BufferHandle{5});

    f.state.bind_vertex_array(VertexArrayHandle{9}, BindMode::Cached);

    ASSERT_EQ(f.state.bound_buffer(BufferTarget::ElementArray), std::nullopt);
}

TEST(GraphicsState, an_unknown_entry_is_rebound_even_when_cached)
{
    Fixture f;
    f.state.bind_buffer(BufferTarget::ElementArray, BufferHandle{5}, BindMode::Cached);
    f.state.bind_vertex_array(VertexArrayHandle{9}, BindMode::Cached);
    f.backend->clear_calls();

    f.state.bind_buffer(BufferTarget::ElementArray, BufferHandle{5}, BindMode::Cached);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 1);
}

TEST(GraphicsState, rebinding_the_same_vertex_array_keeps_the_element_array_binding_known)
{
    Fixture f;
    f.state.bind_vertex_array(VertexArrayHandle{9}, BindMode::Cached);
    f.state.bind_buffer(BufferTarget::ElementArray, BufferHandle{5}, BindMode::Cached);

    f.state.bind_vertex_array(VertexArrayHandle{9}, BindMode::Cached);

    ASSERT_EQ(f.state.bound_buffer(BufferTarget::ElementArray), BufferHandle{5});
    ASSERT_EQ(f.state.stats().num_vertex_array_binds_elided, 1);
}

TEST(GraphicsState, invalidate_forces_the_next_cached_bind_to_be_issued)
{
    Fixture f;
    const BufferHandle h{5};
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);
    f.backend->bind_buffer_behind_the_caches_back(BufferTarget::Array, BufferHandle{6});

    f.state.invalidate();
    f.state.bind_buffer(BufferTarget::Array, h, BindMode::Cached);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindBuffer), 2);
    ASSERT_EQ(f.backend->actual_bound_buffer(BufferTarget::Array), h);
}

TEST(GraphicsState, invalidate_makes_every_entry_unknown)
{
    Fixture f;
    f.state.invalidate();

    ASSERT_EQ(f.state.bound_buffer(BufferTarget::Array), std::nullopt);
    ASSERT_EQ(f.state.bound_buffer(BufferTarget::ElementArray), std::nullopt);
    ASSERT_EQ(f.state.bound_vertex_array(), std::nullopt);
}

TEST(GraphicsState, set_primitive_restart_is_cached)
{
    Fixture f;

    f.state.set_primitive_restart(0xffff);
    f.state.set_primitive_restart(0xffff);
    f.state.set_primitive_restart(std::nullopt);

    ASSERT_EQ(f.backend->count(RecordedCallKind::SetPrimitiveRestart), 2);
    ASSERT_EQ(f.backend->actual_primitive_restart_index(), std::nullopt);
}

TEST(GraphicsState, set_primitive_restart_elides_a_call_that_matches_the_initial_state)
{
    Fixture f;  // primitive restart is initially disabled

    f.state.set_primitive_restart(std::nullopt);

    ASSERT_EQ(f.backend->count(RecordedCallKind::SetPrimitiveRestart), 0);
}

TEST(GraphicsState, cache_agrees_with_backend_after_an_arbitrary_sequence_of_binds)
{
    Fixture f;
    const BufferHandle handles[] = {BufferHandle{1}, BufferHandle{2}, BufferHandle{3}};

    for (int i = 0; i < 20; ++i) {
        const BufferHandle h = handles[(i * 7) % 3];
        const BufferTarget target = i % 2 == 0 ? BufferTarget::Array : BufferTarget::ElementArray;
        f.state.bind_buffer(target, h, i % 5 == 0 ? BindMode::Forced : BindMode::Cached);
        if (i % 4 == 0) {
            f.state.bind_vertex_array(VertexArrayHandle{static_cast<uint32_t>(10 + i % 3)}, BindMode::Cached);
        }

        for (const BufferTarget t : {BufferTarget::Array, BufferTarget::ElementArray}) {
            if (const auto cached = f.state.bound_buffer(t)) {
                ASSERT_EQ(*cached, f.backend->actual_bound_buffer(t));
            }
        }
    }
}
