#include "TessBuilder.h"

#include <liblumen/Graphics/GraphicsContext.h>
#include <liblumen/Graphics/Tess.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>
#include <liblumen/testing/TestVertices.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

using namespace lum;
using namespace lum::testing;

namespace
{
    struct Fixture {
        explicit Fixture(GraphicsBackendLimits limits = {}) :
            backend{std::make_shared<RecordingGraphicsBackend>(GraphicsBackendState{.limits = limits})},
            context{backend}
        {}

        std::shared_ptr<RecordingGraphicsBackend> backend;
        GraphicsContext context;
    };

    const std::vector<ColoredVertex> c_triangle = {
        colored_vertex(-1.0f, -1.0f, 0.0f),
        colored_vertex( 1.0f, -1.0f, 0.0f),
        colored_vertex( 0.0f,  1.0f, 0.0f),
    };

    // asserts that `build` fails with the given kind, and that nothing is left allocated
    void assert_build_fails_with(Fixture& f, TessBuilder& builder, TessErrorKind expected)
    {
        try {
            [[maybe_unused]] const Tess tess = std::move(builder).build();
            FAIL() << "should have thrown a TessError";
        }
        catch (const TessError& ex) {
            ASSERT_EQ(ex.kind(), expected) << ex.what();
        }
        ASSERT_EQ(builder.state(), TessBuilderState::Failed);
        ASSERT_EQ(f.backend->num_live_buffers(), 0);
        ASSERT_EQ(f.backend->num_live_vertex_arrays(), 0);
    }
}

TEST(TessBuilder, starts_in_the_Empty_state)
{
    Fixture f;
    ASSERT_EQ(f.context.new_tess_builder().state(), TessBuilderState::Empty);
}

TEST(TessBuilder, mutating_moves_it_into_the_Accumulating_state)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.set_mode(TessPrimitive::Point);
    ASSERT_EQ(builder.state(), TessBuilderState::Accumulating);
}

TEST(TessBuilder, three_vertices_with_Triangle_mode_builds_a_tess_with_three_vertices)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_mode(TessPrimitive::Triangle);

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(builder.state(), TessBuilderState::Built);
    ASSERT_EQ(tess.vertices_nb(), 3);
    ASSERT_EQ(tess.instances_nb(), 0);
    ASSERT_EQ(tess.mode(), TessMode{TessPrimitive::Triangle});
    ASSERT_EQ(tess.index_type(), std::nullopt);
    ASSERT_EQ(f.backend->num_live_buffers(), 1);
    ASSERT_EQ(f.backend->num_live_vertex_arrays(), 1);
}

TEST(TessBuilder, configures_one_attribute_per_vertex_layout_entry)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle);

    const Tess tess = std::move(builder).build();

    const auto& bindings = f.backend->vertex_attribute_bindings();
    ASSERT_EQ(bindings.size(), 2);
    ASSERT_EQ(bindings[0], (VertexAttributeBinding{0, VertexAttributeFormat::Float32x3, sizeof(ColoredVertex), offsetof(ColoredVertex, position), 0}));
    ASSERT_EQ(bindings[1], (VertexAttributeBinding{1, VertexAttributeFormat::Unorm8x4, sizeof(ColoredVertex), offsetof(ColoredVertex, color), 0}));
}

TEST(TessBuilder, instance_attributes_have_a_divisor_of_one)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle)
        .add_instances(std::vector<InstanceData>(10))
        .set_instance_nb(10)
        .set_vertex_nb(3);

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(tess.instances_nb(), 10);
    const auto& bindings = f.backend->vertex_attribute_bindings();
    ASSERT_EQ(bindings.size(), 4);
    ASSERT_EQ(bindings[2].divisor, 1);
    ASSERT_EQ(bindings[3].divisor, 1);
}

TEST(TessBuilder, two_vertices_and_three_instances_without_overrides_fails_without_leaking)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(2)).add_instances(std::vector<InstanceData>(3));

    assert_build_fails_with(f, builder, TessErrorKind::LengthIncoherency);
    ASSERT_EQ(f.backend->count(RecordedCallKind::CreateBuffer), 0);
}

TEST(TessBuilder, vertex_and_instance_counts_can_differ_if_one_is_explicitly_set)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(2))
        .add_instances(std::vector<InstanceData>(3))
        .set_instance_nb(3);

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(tess.vertices_nb(), 2);
    ASSERT_EQ(tess.instances_nb(), 3);
}

TEST(TessBuilder, vertex_buffers_with_different_lengths_fail)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(3)).add_vertices(std::vector<InstanceData>(4));

    assert_build_fails_with(f, builder, TessErrorKind::LengthIncoherency);
}

TEST(TessBuilder, vertex_override_may_not_exceed_the_shortest_vertex_buffer)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_vertex_nb(4);

    assert_build_fails_with(f, builder, TessErrorKind::LengthIncoherency);
}

TEST(TessBuilder, vertex_override_may_be_smaller_than_the_available_vertices)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_vertex_nb(2);

    ASSERT_EQ(std::move(builder).build().vertices_nb(), 2);
}

TEST(TessBuilder, no_data_and_no_override_fails_with_NoData)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    assert_build_fails_with(f, builder, TessErrorKind::NoData);
}

TEST(TessBuilder, zero_vertices_without_an_override_fails_with_NoData)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<ColoredVertex>{});

    assert_build_fails_with(f, builder, TessErrorKind::NoData);
}

TEST(TessBuilder, attributeless_tess_uses_the_vertex_override)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.set_vertex_nb(4).set_mode(TessPrimitive::TriangleStrip);

    const Tess tess = std::move(builder).build();

    ASSERT_TRUE(tess.is_attributeless());
    ASSERT_EQ(tess.vertices_nb(), 4);
    ASSERT_EQ(f.backend->num_live_buffers(), 0);
    ASSERT_EQ(f.backend->num_live_vertex_arrays(), 1);
}

TEST(TessBuilder, indexed_tess_vertex_count_defaults_to_the_index_count)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 2, 2, 1, 0});

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(tess.vertices_nb(), 6);
    ASSERT_EQ(tess.index_type(), TessIndexType::U16);
}

TEST(TessBuilder, index_buffer_is_recorded_in_the_tess_vertex_array)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint32_t>{0, 1, 2});

    const Tess tess = std::move(builder).build();

    ASSERT_TRUE(f.backend->element_array_buffer_of(tess.vertex_array()));
}

TEST(TessBuilder, index_override_may_not_exceed_the_index_count)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint8_t>{0, 1, 2}).set_vertex_nb(4);

    assert_build_fails_with(f, builder, TessErrorKind::LengthIncoherency);
}

TEST(TessBuilder, out_of_range_raw_index_fails_with_IndexOutOfRange)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 3});

    assert_build_fails_with(f, builder, TessErrorKind::IndexOutOfRange);
}

TEST(TessBuilder, restart_sentinel_is_not_treated_as_an_out_of_range_index)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle)
        .set_mode(TessPrimitive::TriangleStrip)
        .set_indices(std::vector<uint16_t>{0, 1, 2, 0xffff, 2, 1, 0})
        .set_primitive_restart_index(0xffff);

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(tess.vertices_nb(), 7);
    ASSERT_EQ(tess.primitive_restart_index(), 0xffff);
}

TEST(TessBuilder, primitive_restart_without_indices_fails)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_primitive_restart_index(0xffffffff);

    assert_build_fails_with(f, builder, TessErrorKind::ForbiddenPrimitiveRestart);
}

TEST(TessBuilder, arbitrary_restart_index_fails_if_the_backend_only_supports_fixed_index_restart)
{
    Fixture f{GraphicsBackendLimits{.supports_arbitrary_primitive_restart_index = false}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 2}).set_primitive_restart_index(7);

    assert_build_fails_with(f, builder, TessErrorKind::ForbiddenPrimitiveRestart);
}

TEST(TessBuilder, arbitrary_restart_index_is_allowed_if_the_backend_supports_it)
{
    Fixture f{GraphicsBackendLimits{.supports_arbitrary_primitive_restart_index = true}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 2, 7, 0}).set_primitive_restart_index(7);

    ASSERT_EQ(std::move(builder).build().primitive_restart_index(), 7);
}

TEST(TessBuilder, patch_mode_fails_if_the_backend_does_not_support_patches)
{
    Fixture f{GraphicsBackendLimits{.supports_patches = false}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_mode(TessMode::patch(3));

    assert_build_fails_with(f, builder, TessErrorKind::UnsupportedMode);
}

TEST(TessBuilder, patch_mode_fails_if_the_patch_is_too_large)
{
    Fixture f{GraphicsBackendLimits{.supports_patches = true, .max_patch_vertices = 2}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_mode(TessMode::patch(3));

    assert_build_fails_with(f, builder, TessErrorKind::UnsupportedMode);
}

TEST(TessBuilder, patch_mode_builds_if_the_backend_supports_it)
{
    Fixture f{GraphicsBackendLimits{.supports_patches = true, .max_patch_vertices = 32}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_mode(TessMode::patch(3));

    ASSERT_EQ(std::move(builder).build().mode(), TessMode::patch(3));
}

TEST(TessBuilder, attribute_location_beyond_the_backend_limit_fails_with_CannotCreate)
{
    Fixture f{GraphicsBackendLimits{.max_vertex_attributes = 16}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<HighLocationVertex>(3));

    assert_build_fails_with(f, builder, TessErrorKind::CannotCreate);
}

TEST(TessBuilder, too_many_attributes_fails_with_CannotCreate)
{
    Fixture f{GraphicsBackendLimits{.max_vertex_attributes = 3}};
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).add_instances(std::vector<InstanceData>(3));

    assert_build_fails_with(f, builder, TessErrorKind::CannotCreate);
}

TEST(TessBuilder, duplicate_attribute_locations_fail_with_CannotCreate)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).add_vertices(std::vector<PositionVertex>(3));

    assert_build_fails_with(f, builder, TessErrorKind::CannotCreate);
}

TEST(TessBuilder, buffer_creation_failure_midway_releases_everything_allocated)
{
    Fixture f;
    f.backend->set_num_buffers_until_creation_fails(1);  // the vertex buffer succeeds, the index buffer fails
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 2});

    assert_build_fails_with(f, builder, TessErrorKind::CannotCreate);
    ASSERT_EQ(f.backend->count(RecordedCallKind::CreateBuffer), 2);
    ASSERT_EQ(f.backend->count(RecordedCallKind::DeleteBuffer), 1);
}

TEST(TessBuilder, vertex_array_creation_failure_releases_uploaded_buffers)
{
    Fixture f;
    f.backend->set_fail_vertex_array_creation(true);
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle);

    assert_build_fails_with(f, builder, TessErrorKind::CannotCreate);
}

TEST(TessBuilder, failed_build_releases_moved_in_buffers)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertex_buffer(f.context.buffer_from(c_triangle)).set_vertex_nb(10);
    ASSERT_EQ(f.backend->num_live_buffers(), 1);

    assert_build_fails_with(f, builder, TessErrorKind::LengthIncoherency);
}

TEST(TessBuilder, accepts_already_created_buffers)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertex_buffer(f.context.buffer_from(c_triangle))
        .set_index_buffer(f.context.buffer_from(std::vector<uint32_t>{0, 1, 2, 0}));
    f.backend->clear_calls();

    const Tess tess = std::move(builder).build();

    ASSERT_EQ(tess.vertices_nb(), 4);
    ASSERT_EQ(tess.index_type(), TessIndexType::U32);
    ASSERT_EQ(f.backend->count(RecordedCallKind::CreateBuffer), 0);
    ASSERT_EQ(f.backend->num_live_buffers(), 2);
}

TEST(TessBuilder, index_buffer_with_the_wrong_target_is_rejected)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    ASSERT_THROW({ builder.set_index_buffer(f.context.new_buffer<uint16_t>(3, BufferTarget::Array)); }, TessError);
}

TEST(TessBuilder, rejecting_a_buffer_with_the_wrong_target_fails_the_builder_and_releases_its_sources)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertex_buffer(f.context.buffer_from(c_triangle));
    ASSERT_EQ(f.backend->num_live_buffers(), 1);

    try {
        builder.add_instance_buffer(f.context.new_buffer<InstanceData>(3, BufferTarget::ElementArray));
        FAIL() << "should have thrown";
    }
    catch (const TessError& ex) {
        ASSERT_EQ(ex.kind(), TessErrorKind::CannotCreate);
    }

    ASSERT_EQ(builder.state(), TessBuilderState::Failed);
    ASSERT_EQ(f.backend->num_live_buffers(), 0);
    ASSERT_THROW({ builder.set_mode(TessPrimitive::Line); }, TessError);
}

TEST(TessBuilder, every_call_on_a_consumed_builder_throws_BuilderConsumed)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle);
    [[maybe_unused]] const Tess tess = std::move(builder).build();

    const std::vector<std::function<void()>> calls = {
        [&]{ builder.add_vertices(c_triangle); },
        [&]{ builder.add_instances(c_triangle); },
        [&]{ builder.set_indices(std::vector<uint8_t>{0}); },
        [&]{ builder.set_mode(TessPrimitive::Line); },
        [&]{ builder.set_vertex_nb(1); },
        [&]{ builder.set_instance_nb(1); },
        [&]{ builder.set_primitive_restart_index(std::nullopt); },
        [&]{ [[maybe_unused]] const Tess t = std::move(builder).build(); },
    };
    for (const auto& call : calls) {
        try {
            call();
            FAIL() << "should have thrown";
        }
        catch (const TessError& ex) {
            ASSERT_EQ(ex.kind(), TessErrorKind::BuilderConsumed);
        }
    }
}

TEST(TessBuilder, moved_from_builder_behaves_as_consumed)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle);

    TessBuilder other = std::move(builder);
    ASSERT_EQ(other.state(), TessBuilderState::Accumulating);
    ASSERT_EQ(builder.state(), TessBuilderState::Failed);  // NOLINT(bugprone-use-after-move)
    ASSERT_THROW({ builder.set_mode(TessPrimitive::Line); }, TessError);  // NOLINT(bugprone-use-after-move)

    const Tess tess = std::move(other).build();
    ASSERT_EQ(tess.vertices_nb(), 3);
}

TEST(TessBuilder, adding_a_buffer_to_a_consumed_builder_leaves_the_buffer_with_the_caller)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    assert_build_fails_with(f, builder, TessErrorKind::NoData);

    Buffer<ColoredVertex> buffer = f.context.buffer_from(c_triangle);
    ASSERT_THROW({ builder.add_vertex_buffer(std::move(buffer)); }, TessError);
    ASSERT_EQ(buffer.len(), 3);
    ASSERT_EQ(f.backend->num_live_buffers(), 1);
}
