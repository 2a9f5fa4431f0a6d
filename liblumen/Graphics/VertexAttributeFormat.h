#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace lum
{
    // the in-memory format of one vertex attribute
    enum class VertexAttributeFormat {
        Float32,
        Float32x2,
        Float32x3,
        Float32x4,
        Unorm8x4,
        Snorm8x4,
        Uint32,
        Int32,
        NUM_OPTIONS,
    };

    // the scalar type of each component of a `VertexAttributeFormat`
    enum class VertexAttributeComponentType {
        Float32,
        Uint8,
        Int8,
        Uint32,
        Int32,
        NUM_OPTIONS,
    };

    VertexAttributeComponentType component_type_of(VertexAttributeFormat);
    size_t num_components_in(VertexAttributeFormat);
    size_t component_size_of(VertexAttributeFormat);

    // returns the number of bytes that one attribute of the given format occupies
    constexpr size_t stride_of(VertexAttributeFormat format)
    {
        switch (format) {
        case VertexAttributeFormat::Float32:   return 1 * sizeof(float);
        case VertexAttributeFormat::Float32x2: return 2 * sizeof(float);
        case VertexAttributeFormat::Float32x3: return 3 * sizeof(float);
        case VertexAttributeFormat::Float32x4: return 4 * sizeof(float);
        case VertexAttributeFormat::Unorm8x4:  return 4 * sizeof(uint8_t);
        case VertexAttributeFormat::Snorm8x4:  return 4 * sizeof(int8_t);
        case VertexAttributeFormat::Uint32:    return sizeof(uint32_t);
        case VertexAttributeFormat::Int32:     return sizeof(int32_t);
        default:                               return 0;
        }
    }

    // returns `true` if the backend should normalize the (integral) components
    // into the range [0, 1] (unsigned) or [-1, 1] (signed) when the shader reads them
    bool is_normalized(VertexAttributeFormat);

    // returns `true` if the shader should read the attribute as an integer (i.e.
    // not converted to floating-point)
    bool is_integral(VertexAttributeFormat);

    std::ostream& operator<<(std::ostream&, VertexAttributeFormat);
}
