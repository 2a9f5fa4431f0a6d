#pragma once

#include <liblumen/Graphics/Vertex.h>
#include <liblumen/Graphics/VertexAttributeDescriptor.h>

#include <algorithm>
#include <cstddef>
#include <ranges>
#include <span>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace lum
{
    // returns `true` if every attribute of `V` lies within the bytes of one `V`
    template<Vertex V>
    constexpr bool vertex_layout_fits()
    {
        return std::ranges::all_of(V::vertex_layout(), [](const VertexAttributeDescriptor& a)
        {
            return a.offset() + a.stride() <= sizeof(V);
        });
    }

    // a runtime (type-erased) copy of a `Vertex` type's memory layout
    //
    // the tessellation machinery uses this to configure vertex attributes and to
    // check that a caller is mapping a tessellation's buffer with the same type
    // that it was built with
    class VertexLayout final {
    public:
        template<Vertex V>
        static VertexLayout of()
        {
            constexpr auto attributes = V::vertex_layout();
            static_assert(vertex_layout_fits<V>(), "a vertex attribute extends past the end of the vertex type");
            return VertexLayout{typeid(V), sizeof(V), std::vector<VertexAttributeDescriptor>(std::ranges::begin(attributes), std::ranges::end(attributes))};
        }

        std::type_index vertex_type() const { return vertex_type_; }
        size_t stride() const { return stride_; }
        std::span<const VertexAttributeDescriptor> attributes() const { return attributes_; }
        size_t num_attributes() const { return attributes_.size(); }

        friend bool operator==(const VertexLayout&, const VertexLayout&) = default;

    private:
        VertexLayout(
            std::type_index vertex_type,
            size_t stride,
            std::vector<VertexAttributeDescriptor> attributes) :

            vertex_type_{vertex_type},
            stride_{stride},
            attributes_{std::move(attributes)}
        {}

        std::type_index vertex_type_;
        size_t stride_;
        std::vector<VertexAttributeDescriptor> attributes_;
    };
}
