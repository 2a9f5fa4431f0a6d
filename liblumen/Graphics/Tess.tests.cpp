#include "Tess.h"

#include <liblumen/Graphics/GraphicsContext.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/TessBuilder.h>
#include <liblumen/Graphics/TessMapError.h>
#include <liblumen/testing/RecordingGraphicsBackend.h>
#include <liblumen/testing/TestVertices.h>

#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace lum;
using namespace lum::testing;

namespace
{
    struct Fixture {
        std::shared_ptr<RecordingGraphicsBackend> backend = std::make_shared<RecordingGraphicsBackend>();
        GraphicsContext context{backend};
    };

    const std::vector<ColoredVertex> c_triangle = {
        colored_vertex(-1.0f, -1.0f, 0.0f),
        colored_vertex( 1.0f, -1.0f, 0.0f),
        colored_vertex( 0.0f,  1.0f, 0.0f),
    };

    Tess build_triangle(GraphicsContext& context)
    {
        TessBuilder builder = context.new_tess_builder();
        builder.add_vertices(c_triangle).set_indices(std::vector<uint16_t>{0, 1, 2});
        return std::move(builder).build();
    }

    TessMapErrorKind map_error_kind_of(const std::function<void()>& f)
    {
        try {
            f();
        }
        catch (const TessMapError& ex) {
            return ex.kind();
        }
        throw std::runtime_error{"expected a TessMapError to be thrown"};
    }
}

TEST(Tess, vertices_maps_the_uploaded_vertex_data)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);

    const BufferSlice<ColoredVertex> vertices = tess.vertices<ColoredVertex>();

    ASSERT_EQ(std::vector<ColoredVertex>(vertices.begin(), vertices.end()), c_triangle);
}

TEST(Tess, vertices_mut_writes_are_visible_in_later_mappings)
{
    Fixture f;
    Tess tess = build_triangle(f.context);
    const ColoredVertex replacement = colored_vertex(9.0f, 9.0f, 9.0f);

    tess.vertices_mut<ColoredVertex>()[1] = replacement;

    ASSERT_EQ(tess.vertices<ColoredVertex>()[1], replacement);
}

TEST(Tess, indices_maps_the_uploaded_index_data)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);

    const BufferSlice<uint16_t> indices = tess.indices<uint16_t>();

    ASSERT_EQ(std::vector<uint16_t>(indices.begin(), indices.end()), (std::vector<uint16_t>{0, 1, 2}));
}

TEST(Tess, indices_mut_writes_are_visible_in_later_mappings)
{
    Fixture f;
    Tess tess = build_triangle(f.context);

    {
        BufferSliceMut<uint16_t> indices = tess.indices_mut<uint16_t>();
        indices[0] = 2;
        indices[2] = 0;
    }

    const BufferSlice<uint16_t> indices = tess.indices<uint16_t>();
    ASSERT_EQ(std::vector<uint16_t>(indices.begin(), indices.end()), (std::vector<uint16_t>{2, 1, 0}));
}

TEST(Tess, instances_mut_writes_are_visible_in_later_mappings)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(c_triangle)
        .add_instances(std::vector<InstanceData>{{.offset = {1.0f, 2.0f}, .id = 1}, {.offset = {3.0f, 4.0f}, .id = 2}})
        .set_instance_nb(2);
    Tess tess = std::move(builder).build();

    tess.instances_mut<InstanceData>()[1].id = 7;

    const BufferSlice<InstanceData> instances = tess.instances<InstanceData>();
    ASSERT_EQ(instances.size(), 2);
    ASSERT_EQ(instances[0], (InstanceData{.offset = {1.0f, 2.0f}, .id = 1}));
    ASSERT_EQ(instances[1], (InstanceData{.offset = {3.0f, 4.0f}, .id = 7}));
}

TEST(Tess, mapping_indices_does_not_disturb_the_tess_vertex_array)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);
    const BufferHandle element_buffer = f.backend->element_array_buffer_of(tess.vertex_array());

    f.context.state().bind_vertex_array(tess.vertex_array(), BindMode::Cached);
    {
        [[maybe_unused]] const BufferSlice<uint16_t> indices = tess.indices<uint16_t>();
    }

    ASSERT_EQ(f.backend->element_array_buffer_of(tess.vertex_array()), element_buffer);
}

TEST(Tess, mapping_with_the_wrong_vertex_type_fails_with_VertexTypeMismatch)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);

    ASSERT_EQ(map_error_kind_of([&]{ tess.vertices<PositionVertex>(); }), TessMapErrorKind::VertexTypeMismatch);
}

TEST(Tess, mapping_with_the_wrong_index_type_fails_with_IndexTypeMismatch)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);

    ASSERT_EQ(map_error_kind_of([&]{ tess.indices<uint32_t>(); }), TessMapErrorKind::IndexTypeMismatch);
}

TEST(Tess, mapping_data_that_does_not_exist_fails_with_ForbiddenAttributelessMapping)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);

    ASSERT_EQ(map_error_kind_of([&]{ tess.instances<InstanceData>(); }), TessMapErrorKind::ForbiddenAttributelessMapping);
}

TEST(Tess, mapping_deinterleaved_vertex_data_fails_with_ForbiddenDeinterleavedMapping)
{
    Fixture f;
    TessBuilder builder = f.context.new_tess_builder();
    builder.add_vertices(std::vector<PositionVertex>(3)).add_vertices(std::vector<InstanceData>(3));
    const Tess tess = std::move(builder).build();

    ASSERT_EQ(map_error_kind_of([&]{ tess.vertices<PositionVertex>(); }), TessMapErrorKind::ForbiddenDeinterleavedMapping);
}

TEST(Tess, backend_mapping_failure_fails_with_BufferMapError)
{
    Fixture f;
    const Tess tess = build_triangle(f.context);
    f.backend->set_fail_mapping(true);

    ASSERT_EQ(map_error_kind_of([&]{ tess.vertices<ColoredVertex>(); }), TessMapErrorKind::BufferMapError);
}

TEST(Tess, destruction_releases_every_resource)
{
    Fixture f;
    {
        const Tess tess = build_triangle(f.context);
        ASSERT_EQ(f.backend->num_live_buffers(), 2);
        ASSERT_EQ(f.backend->num_live_vertex_arrays(), 1);
    }
    ASSERT_EQ(f.backend->num_live_buffers(), 0);
    ASSERT_EQ(f.backend->num_live_vertex_arrays(), 0);
}

TEST(Tess, destruction_of_a_bound_tess_leaves_the_cache_agreeing_with_the_backend)
{
    Fixture f;
    {
        const Tess tess = build_triangle(f.context);
        f.context.state().bind_vertex_array(tess.vertex_array(), BindMode::Cached);
    }
    ASSERT_EQ(f.context.state().bound_vertex_array(), VertexArrayHandle{});
    ASSERT_EQ(f.backend->actual_bound_vertex_array(), VertexArrayHandle{});
}
