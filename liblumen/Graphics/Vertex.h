#pragma once

#include <liblumen/Graphics/VertexAttributeDescriptor.h>

#include <concepts>
#include <ranges>
#include <type_traits>

namespace lum
{
    // satisfied by types that can be uploaded to a vertex (or instance) buffer
    //
    // a `Vertex` must be trivially copyable with a standard layout (because its
    // bytes are copied onto the GPU as-is) and must publish its memory layout
    // through a `static constexpr vertex_layout()` function that returns a range
    // of `VertexAttributeDescriptor`s, e.g.:
    //
    //     struct ColoredVertex final {
    //         std::array<float, 3> position;
    //         std::array<uint8_t, 4> color;
    //
    //         static constexpr auto vertex_layout()
    //         {
    //             return std::to_array<VertexAttributeDescriptor>({
    //                 {0, VertexAttributeFormat::Float32x3, offsetof(ColoredVertex, position)},
    //                 {1, VertexAttributeFormat::Unorm8x4, offsetof(ColoredVertex, color)},
    //             });
    //         }
    //     };
    template<typename T>
    concept Vertex =
        std::is_trivially_copyable_v<T> and
        std::is_standard_layout_v<T> and
        requires {
            { T::vertex_layout() } -> std::ranges::range;
        } and
        std::same_as<std::ranges::range_value_t<decltype(T::vertex_layout())>, VertexAttributeDescriptor>;
}
