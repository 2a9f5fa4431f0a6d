#include "TessGate.h"

#include <liblumen/Graphics/DrawCommand.h>
#include <liblumen/Graphics/GraphicsContext.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/Tess.h>
#include <liblumen/Graphics/TessBuilder.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/Graphics/TessView.h>
#include <liblumen/Platform/LogLevel.h>
#include <liblumen/testing/CapturingLogSink.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>
#include <liblumen/testing/TestVertices.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

using namespace lum;
using namespace lum::testing;

namespace
{
    struct Fixture {
        std::shared_ptr<RecordingGraphicsBackend> backend = std::make_shared<RecordingGraphicsBackend>();
        GraphicsContext context{backend};
        TessGate gate = context.tess_gate();
    };

    Tess build_quad(GraphicsContext& context, std::optional<uint32_t> restart_index = std::nullopt)
    {
        TessBuilder builder = context.new_tess_builder();
        builder.add_vertices(std::vector<PositionVertex>{{{0.0f, 0.0f}}, {{1.0f, 0.0f}}, {{1.0f, 1.0f}}, {{0.0f, 1.0f}}})
            .set_indices(restart_index ? std::vector<uint16_t>{0, 1, 2, 0xffff, 0, 2, 3} : std::vector<uint16_t>{0, 1, 2, 0, 2, 3})
            .set_mode(TessPrimitive::TriangleStrip)
            .set_primitive_restart_index(restart_index);
        return std::move(builder).build();
    }

    Tess build_points(GraphicsContext& context, size_t n)
    {
        TessBuilder builder = context.new_tess_builder();
        builder.add_vertices(std::vector<PositionVertex>(n)).set_mode(TessPrimitive::Point);
        return std::move(builder).build();
    }
}

TEST(TessGate, render_issues_exactly_one_draw_for_the_whole_tess)
{
    Fixture f;
    const Tess tess = build_points(f.context, 5);

    f.gate.render(tess);

    ASSERT_EQ(f.backend->draw_commands().size(), 1);
    ASSERT_EQ(f.backend->draw_commands().front(), (DrawCommand{
        .mode = TessPrimitive::Point,
        .start_index = 0,
        .vert_nb = 5,
        .inst_nb = 0,
        .index_type = std::nullopt,
    }));
}

TEST(TessGate, render_draws_with_the_tess_vertex_array_bound)
{
    Fixture f;
    const Tess tess = build_points(f.context, 5);
    f.context.state().bind_vertex_array(VertexArrayHandle{}, BindMode::Cached);
    f.backend->clear_calls();

    f.gate.render(tess);

    ASSERT_EQ(f.backend->calls().back().kind, RecordedCallKind::Draw);
    ASSERT_EQ(f.backend->calls().back().handle, tess.vertex_array().get());
}

TEST(TessGate, rendering_the_same_tess_twice_elides_the_second_vertex_array_bind)
{
    Fixture f;
    const Tess tess = build_points(f.context, 5);
    f.gate.render(tess);
    f.backend->clear_calls();

    f.gate.render(tess);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindVertexArray), 0);
    ASSERT_EQ(f.backend->count(RecordedCallKind::Draw), 1);
}

TEST(TessGate, render_of_a_slice_draws_the_slice)
{
    Fixture f;
    const Tess tess = build_points(f.context, 10);

    f.gate.render(TessView::slice(tess, 2, 5));

    ASSERT_EQ(f.backend->draw_commands().back().start_index, 2);
    ASSERT_EQ(f.backend->draw_commands().back().vert_nb, 5);
}

TEST(TessGate, render_logs_each_draw_at_trace_level)
{
    Fixture f;
    const Tess tess = build_points(f.context, 4);
    auto sink = std::make_shared<CapturingLogSink>();
    const ScopedLogSinkAttachment attachment{sink};

    f.gate.render(TessView::slice(tess, 1, 3));

    ASSERT_TRUE(sink->contains(LogLevel::trace, "drawing 3 vertices (from index 1) and 0 instances"));
}

TEST(TessGate, out_of_range_view_fails_with_ViewOutOfRange_and_issues_no_draw)
{
    Fixture f;
    const Tess tess = build_points(f.context, 10);

    for (const TessView& view : {TessView::slice(tess, 8, 3), TessView::sub(tess, 11), TessView::slice(tess, 11, 0)}) {
        try {
            f.gate.render(view);
            FAIL() << "should have thrown";
        }
        catch (const TessError& ex) {
            ASSERT_EQ(ex.kind(), TessErrorKind::ViewOutOfRange);
        }
    }
    ASSERT_EQ(f.backend->count(RecordedCallKind::Draw), 0);
}

TEST(TessGate, view_that_ends_exactly_at_the_end_is_in_range)
{
    Fixture f;
    const Tess tess = build_points(f.context, 10);

    ASSERT_NO_THROW({ f.gate.render(TessView::slice(tess, 7, 3)); });
    ASSERT_NO_THROW({ f.gate.render(TessView::slice(tess, 10, 0)); });
}

TEST(TessGate, indexed_render_issues_an_indexed_draw)
{
    Fixture f;
    const Tess tess = build_quad(f.context, 0xffff);

    f.gate.render(tess);

    ASSERT_EQ(f.backend->draw_commands().back().index_type, TessIndexType::U16);
    ASSERT_EQ(f.backend->draw_commands().back().vert_nb, 7);
}

TEST(TessGate, render_applies_the_tess_primitive_restart_setting_through_the_cache)
{
    Fixture f;
    const Tess restarting = build_quad(f.context, 0xffff);
    const Tess non_restarting = build_quad(f.context, std::nullopt);

    f.gate.render(restarting);
    ASSERT_EQ(f.backend->actual_primitive_restart_index(), 0xffff);
    f.gate.render(restarting);
    ASSERT_EQ(f.backend->count(RecordedCallKind::SetPrimitiveRestart), 1);

    f.gate.render(non_restarting);
    ASSERT_EQ(f.backend->actual_primitive_restart_index(), std::nullopt);
    ASSERT_EQ(f.backend->count(RecordedCallKind::SetPrimitiveRestart), 2);
}

TEST(TessGate, instanced_render_issues_an_instanced_draw)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(4))
        .add_instances(std::vector<InstanceData>(8))
        .set_instance_nb(8);
    const Tess tess = std::move(builder).build();

    f.gate.render(TessView::inst_whole(tess, 6));

    ASSERT_EQ(f.backend->draw_commands().back().inst_nb, 6);
}

TEST(TessGate, instanced_sub_and_slice_views_draw_their_vertex_and_instance_ranges)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(6))
        .add_instances(std::vector<InstanceData>(4))
        .set_instance_nb(4);
    const Tess tess = std::move(builder).build();

    f.gate.render(TessView::inst_sub(tess, 3, 2));
    ASSERT_EQ(f.backend->draw_commands().back(), (DrawCommand{
        .mode = TessPrimitive::Triangle,
        .start_index = 0,
        .vert_nb = 3,
        .inst_nb = 2,
        .index_type = std::nullopt,
    }));

    f.gate.render(TessView::inst_slice(tess, 3, 3, 4));
    ASSERT_EQ(f.backend->draw_commands().back(), (DrawCommand{
        .mode = TessPrimitive::Triangle,
        .start_index = 3,
        .vert_nb = 3,
        .inst_nb = 4,
        .index_type = std::nullopt,
    }));

    ASSERT_THROW({ f.gate.render(TessView::inst_slice(tess, 3, 3, 5)); }, TessError);
    ASSERT_EQ(f.backend->draw_commands().size(), 2);
}

TEST(TessGate, drawing_more_instances_than_there_is_instance_data_for_fails)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(4))
        .add_instances(std::vector<InstanceData>(8))
        .set_instance_nb(8);
    const Tess tess = std::move(builder).build();

    ASSERT_THROW({ f.gate.render(TessView::inst_whole(tess, 9)); }, TessError);
    ASSERT_EQ(f.backend->count(RecordedCallKind::Draw), 0);
}

TEST(TessGate, attributeless_tess_can_be_drawn_with_any_number_of_instances)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.set_vertex_nb(3);
    const Tess tess = std::move(builder).build();

    f.gate.render(TessView::inst_whole(tess, 100));

    ASSERT_EQ(f.backend->draw_commands().back(), (DrawCommand{
        .mode = TessPrimitive::Triangle,
        .start_index = 0,
        .vert_nb = 3,
        .inst_nb = 100,
        .index_type = std::nullopt,
    }));
}

TEST(TessGate, render_rebinds_after_the_state_is_invalidated)
{
    Fixture f;
    const Tess tess = build_points(f.context, 3);
    f.gate.render(tess);
    f.context.invalidate_state();
    f.backend->clear_calls();

    f.gate.render(tess);

    ASSERT_EQ(f.backend->count(RecordedCallKind::BindVertexArray), 1);
}
