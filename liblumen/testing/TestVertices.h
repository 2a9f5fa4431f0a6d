#pragma once

#include <liblumen/Graphics/VertexAttributeDescriptor.h>
#include <liblumen/Graphics/VertexAttributeFormat.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace lum::testing
{
    // a typical interleaved vertex: a position plus a color
    struct ColoredVertex final {
        friend bool operator==(const ColoredVertex&, const ColoredVertex&) = default;

        std::array<float, 3> position{};
        std::array<uint8_t, 4> color{};

        static constexpr auto vertex_layout()
        {
            return std::to_array<VertexAttributeDescriptor>({
                {0, VertexAttributeFormat::Float32x3, offsetof(ColoredVertex, position)},
                {1, VertexAttributeFormat::Unorm8x4, offsetof(ColoredVertex, color)},
            });
        }
    };

    // a position-only vertex
    struct PositionVertex final {
        friend bool operator==(const PositionVertex&, const PositionVertex&) = default;

        std::array<float, 2> position{};

        static constexpr auto vertex_layout()
        {
            return std::to_array<VertexAttributeDescriptor>({
                {0, VertexAttributeFormat::Float32x2, offsetof(PositionVertex, position)},
            });
        }
    };

    // per-instance data: an offset plus an integral id
    struct InstanceData final {
        friend bool operator==(const InstanceData&, const InstanceData&) = default;

        std::array<float, 2> offset{};
        uint32_t id = 0;

        static constexpr auto vertex_layout()
        {
            return std::to_array<VertexAttributeDescriptor>({
                {2, VertexAttributeFormat::Float32x2, offsetof(InstanceData, offset)},
                {3, VertexAttributeFormat::Uint32, offsetof(InstanceData, id)},
            });
        }
    };

    // a vertex type that uses an attribute location beyond what most backends support
    struct HighLocationVertex final {
        float value = 0.0f;

        static constexpr auto vertex_layout()
        {
            return std::to_array<VertexAttributeDescriptor>({
                {40, VertexAttributeFormat::Float32, offsetof(HighLocationVertex, value)},
            });
        }
    };

    inline ColoredVertex colored_vertex(float x, float y, float z)
    {
        return ColoredVertex{{x, y, z}, {255, 255, 255, 255}};
    }
}
