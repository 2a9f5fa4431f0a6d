#include "VertexLayout.h"

#include <liblumen/Graphics/VertexAttributeFormat.h>
#include <liblumen/testing/TestVertices.h>

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <typeindex>

using namespace lum;
using namespace lum::testing;

static_assert(Vertex<ColoredVertex>);
static_assert(Vertex<InstanceData>);
static_assert(not Vertex<float>);
static_assert(not Vertex<uint16_t>);

namespace
{
    // the last attribute starts inside the vertex, but its second component does not
    struct OverrunningVertex final {
        std::array<float, 2> position{};
        float weight = 0.0f;

        static constexpr auto vertex_layout()
        {
            return std::to_array<VertexAttributeDescriptor>({
                {0, VertexAttributeFormat::Float32x2, offsetof(OverrunningVertex, position)},
                {1, VertexAttributeFormat::Float32x2, offsetof(OverrunningVertex, weight)},
            });
        }
    };
}

static_assert(vertex_layout_fits<ColoredVertex>());
static_assert(vertex_layout_fits<InstanceData>());
static_assert(vertex_layout_fits<HighLocationVertex>());
static_assert(Vertex<OverrunningVertex>);
static_assert(not vertex_layout_fits<OverrunningVertex>());
static_assert(VertexAttributeDescriptor{0, VertexAttributeFormat::Float32x3, 4}.stride() == 12);

TEST(VertexLayout, of_copies_the_vertex_types_layout)
{
    const VertexLayout layout = VertexLayout::of<ColoredVertex>();

    ASSERT_EQ(layout.vertex_type(), std::type_index{typeid(ColoredVertex)});
    ASSERT_EQ(layout.stride(), sizeof(ColoredVertex));
    ASSERT_EQ(layout.num_attributes(), 2);
    ASSERT_EQ(layout.attributes()[1], (VertexAttributeDescriptor{1, VertexAttributeFormat::Unorm8x4, offsetof(ColoredVertex, color)}));
}

TEST(VertexLayout, layouts_of_different_types_compare_unequal)
{
    ASSERT_EQ(VertexLayout::of<ColoredVertex>(), VertexLayout::of<ColoredVertex>());
    ASSERT_NE(VertexLayout::of<ColoredVertex>(), VertexLayout::of<PositionVertex>());
}

TEST(VertexAttributeFormat, reports_component_counts_and_strides)
{
    ASSERT_EQ(num_components_in(VertexAttributeFormat::Float32x3), 3);
    ASSERT_EQ(stride_of(VertexAttributeFormat::Float32x3), 12);
    ASSERT_EQ(stride_of(VertexAttributeFormat::Unorm8x4), 4);
    ASSERT_EQ(component_type_of(VertexAttributeFormat::Snorm8x4), VertexAttributeComponentType::Int8);
}

TEST(VertexAttributeFormat, normalized_and_integral_formats_are_distinguished)
{
    ASSERT_TRUE(is_normalized(VertexAttributeFormat::Unorm8x4));
    ASSERT_FALSE(is_normalized(VertexAttributeFormat::Float32x2));
    ASSERT_TRUE(is_integral(VertexAttributeFormat::Uint32));
    ASSERT_FALSE(is_integral(VertexAttributeFormat::Unorm8x4));
}
