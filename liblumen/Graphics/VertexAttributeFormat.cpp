#include "VertexAttributeFormat.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

using namespace lum;

namespace
{
    struct FormatTraits final {
        std::string_view name;
        VertexAttributeComponentType component_type;
        size_t num_components;
        bool normalized;
        bool integral;
    };

    constexpr auto c_format_traits = std::to_array<FormatTraits>({
        {"Float32",   VertexAttributeComponentType::Float32, 1, false, false},
        {"Float32x2", VertexAttributeComponentType::Float32, 2, false, false},
        {"Float32x3", VertexAttributeComponentType::Float32, 3, false, false},
        {"Float32x4", VertexAttributeComponentType::Float32, 4, false, false},
        {"Unorm8x4",  VertexAttributeComponentType::Uint8,   4, true,  false},
        {"Snorm8x4",  VertexAttributeComponentType::Int8,    4, true,  false},
        {"Uint32",    VertexAttributeComponentType::Uint32,  1, false, true},
        {"Int32",     VertexAttributeComponentType::Int32,   1, false, true},
    });
    static_assert(c_format_traits.size() == num_options<VertexAttributeFormat>());

    constexpr auto c_component_sizes = std::to_array<size_t>({
        sizeof(float),
        sizeof(uint8_t),
        sizeof(int8_t),
        sizeof(uint32_t),
        sizeof(int32_t),
    });
    static_assert(c_component_sizes.size() == num_options<VertexAttributeComponentType>());

    const FormatTraits& traits_of(VertexAttributeFormat format)
    {
        return c_format_traits.at(to_index(format));
    }
}

VertexAttributeComponentType lum::component_type_of(VertexAttributeFormat format)
{
    return traits_of(format).component_type;
}

size_t lum::num_components_in(VertexAttributeFormat format)
{
    return traits_of(format).num_components;
}

size_t lum::component_size_of(VertexAttributeFormat format)
{
    return c_component_sizes.at(to_index(component_type_of(format)));
}

bool lum::is_normalized(VertexAttributeFormat format)
{
    return traits_of(format).normalized;
}

bool lum::is_integral(VertexAttributeFormat format)
{
    return traits_of(format).integral;
}

std::ostream& lum::operator<<(std::ostream& o, VertexAttributeFormat format)
{
    return o << traits_of(format).name;
}
