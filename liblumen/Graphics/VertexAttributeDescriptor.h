#pragma once

#include <liblumen/Graphics/VertexAttributeFormat.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace lum
{
    // describes one attribute in a vertex type's memory layout: which shader
    // location it feeds, its format, and its byte offset within the vertex
    class VertexAttributeDescriptor final {
    public:
        constexpr VertexAttributeDescriptor(
            uint32_t location,
            VertexAttributeFormat format,
            size_t offset) :

            location_{location},
            format_{format},
            offset_{offset}
        {}

        friend constexpr bool operator==(const VertexAttributeDescriptor&, const VertexAttributeDescriptor&) = default;

        constexpr uint32_t location() const { return location_; }
        constexpr VertexAttributeFormat format() const { return format_; }
        constexpr size_t offset() const { return offset_; }
        constexpr size_t stride() const { return stride_of(format_); }

    private:
        uint32_t location_;
        VertexAttributeFormat format_;
        size_t offset_;
    };

    std::ostream& operator<<(std::ostream&, const VertexAttributeDescriptor&);
}
