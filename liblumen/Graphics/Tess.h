#pragma once

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/BufferSlice.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Graphics/TessIndex.h>
#include <liblumen/Graphics/TessMapError.h>
#include <liblumen/Graphics/TessMode.h>
#include <liblumen/Graphics/Vertex.h>
#include <liblumen/Graphics/VertexArray.h>
#include <liblumen/Graphics/VertexLayout.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace lum { class GraphicsState; }

namespace lum::detail
{
    // a GPU buffer of vertex (or instance) data, plus the layout of each element
    struct TessVertexBuffer final {
        VertexLayout layout;
        RawBuffer buffer;
    };

    struct TessIndexBuffer final {
        TessIndexType index_type;
        RawBuffer buffer;
    };
}

namespace lum
{
    // an immutable, GPU-resident, tessellation (mesh)
    //
    // created via a `TessBuilder`. Owns its vertex array object and every buffer
    // that was uploaded to (or moved into) the builder. Rendered through a
    // `TessGate`, via a `TessView`.
    class Tess final {
    public:
        Tess(const Tess&) = delete;
        Tess(Tess&&) noexcept = default;
        Tess& operator=(const Tess&) = delete;
        Tess& operator=(Tess&&) noexcept = default;
        ~Tess() noexcept = default;

        // returns the number of vertices (or indices, if the tessellation is indexed) that
        // a draw of the whole tessellation reads
        size_t vertices_nb() const { return vert_nb_; }

        // returns the number of instances, or zero if the tessellation isn't instanced
        size_t instances_nb() const { return inst_nb_; }

        TessMode mode() const { return mode_; }

        // returns `std::nullopt` if the tessellation isn't indexed
        std::optional<TessIndexType> index_type() const
        {
            return index_buffer_ ? std::optional{index_buffer_->index_type} : std::nullopt;
        }

        std::optional<uint32_t> primitive_restart_index() const { return primitive_restart_index_; }

        size_t num_vertex_buffers() const { return vertex_buffers_.size(); }
        size_t num_instance_buffers() const { return instance_buffers_.size(); }
        bool is_attributeless() const { return vertex_buffers_.empty() and instance_buffers_.empty() and not index_buffer_; }

        VertexArrayHandle vertex_array() const { return vertex_array_.handle(); }

        const GraphicsState& state() const { return *state_; }

        // scoped mappings of the tessellation's (single) vertex buffer
        template<Vertex V>
        BufferSlice<V> vertices() const
        {
            return map_as<BufferSlice<V>>(mappable_buffer(vertex_buffers_, typeid(V), "vertex"));
        }

        template<Vertex V>
        BufferSliceMut<V> vertices_mut()
        {
            return map_as<BufferSliceMut<V>>(mappable_buffer(vertex_buffers_, typeid(V), "vertex"));
        }

        // scoped mappings of the tessellation's (single) instance buffer
        template<Vertex V>
        BufferSlice<V> instances() const
        {
            return map_as<BufferSlice<V>>(mappable_buffer(instance_buffers_, typeid(V), "instance"));
        }

        template<Vertex V>
        BufferSliceMut<V> instances_mut()
        {
            return map_as<BufferSliceMut<V>>(mappable_buffer(instance_buffers_, typeid(V), "instance"));
        }

        // scoped mappings of the tessellation's index buffer
        template<TessIndex I>
        BufferSlice<I> indices() const
        {
            return map_as<BufferSlice<I>>(mappable_index_buffer(TessIndexTraits<I>::index_type));
        }

        template<TessIndex I>
        BufferSliceMut<I> indices_mut()
        {
            return map_as<BufferSliceMut<I>>(mappable_index_buffer(TessIndexTraits<I>::index_type));
        }

    private:
        friend class TessBuilder;
        friend class TessGate;

        Tess(
            std::shared_ptr<GraphicsState> state,
            VertexArray vertex_array,
            std::vector<detail::TessVertexBuffer> vertex_buffers,
            std::vector<detail::TessVertexBuffer> instance_buffers,
            std::optional<detail::TessIndexBuffer> index_buffer,
            TessMode mode,
            size_t vert_nb,
            size_t inst_nb,
            std::optional<uint32_t> primitive_restart_index
        );

        template<typename Slice>
        static Slice map_as(const RawBuffer& buffer)
        {
            try {
                return Slice{buffer};
            }
            catch (const BufferError& ex) {
                throw TessMapError{TessMapErrorKind::BufferMapError, ex.what()};
            }
        }

        static const RawBuffer& mappable_buffer(
            std::span<const detail::TessVertexBuffer>,
            std::type_index requested_type,
            std::string_view buffer_kind
        );
        const RawBuffer& mappable_index_buffer(TessIndexType requested_type) const;

        std::shared_ptr<GraphicsState> state_;
        std::vector<detail::TessVertexBuffer> vertex_buffers_;
        std::vector<detail::TessVertexBuffer> instance_buffers_;
        std::optional<detail::TessIndexBuffer> index_buffer_;
        VertexArray vertex_array_;  // declared after the buffers, so that it is destroyed first
        TessMode mode_;
        size_t vert_nb_ = 0;
        size_t inst_nb_ = 0;
        std::optional<uint32_t> primitive_restart_index_;
    };
}
