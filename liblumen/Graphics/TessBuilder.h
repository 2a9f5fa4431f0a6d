#pragma once

#include <liblumen/Graphics/Buffer.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/GraphicsContextParams.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Graphics/Tess.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/Graphics/TessIndex.h>
#include <liblumen/Graphics/TessMode.h>
#include <liblumen/Graphics/Vertex.h>
#include <liblumen/Graphics/VertexLayout.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lum { class GraphicsState; }

namespace lum
{
    enum class TessBuilderState {
        Empty,
        Accumulating,
        Built,
        Failed,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, TessBuilderState);
}

namespace lum::detail
{
    // vertex (or instance) data that's either still in client memory, waiting
    // to be uploaded by `build`, or an already-created buffer
    struct TessVertexSource final {
        VertexLayout layout;
        size_t len;
        std::variant<std::vector<std::byte>, RawBuffer> data;
    };

    struct TessIndexSource final {
        TessIndexType index_type;
        size_t len;
        std::variant<std::vector<std::byte>, RawBuffer> data;
    };
}

namespace lum
{
    // accumulates vertex, instance, and index data plus draw parameters, and then
    // validates and uploads them into a `Tess`
    //
    // created via `GraphicsContext::new_tess_builder`. `build` consumes the
    // builder: every call made on it afterwards throws `TessError` (`BuilderConsumed`).
    // Raw data is only uploaded when `build` is called, after validation.
    class TessBuilder final {
    public:
        TessBuilder(std::shared_ptr<GraphicsState>, const GraphicsContextParams&);
        TessBuilder(const TessBuilder&) = delete;
        TessBuilder(TessBuilder&&) noexcept;
        TessBuilder& operator=(const TessBuilder&) = delete;
        TessBuilder& operator=(TessBuilder&&) noexcept;
        ~TessBuilder() noexcept;

        TessBuilderState state() const { return state_; }

        // appends one set of (interleaved) vertex data
        template<std::ranges::contiguous_range Range>
        requires Vertex<std::ranges::range_value_t<Range>>
        TessBuilder& add_vertices(const Range& vertices)
        {
            using V = std::ranges::range_value_t<Range>;
            const std::span<const V> span{vertices};
            add_raw_vertex_source(vertex_sources_, VertexLayout::of<V>(), std::as_bytes(span), span.size());
            return *this;
        }

        // appends one set of (interleaved) per-instance data
        template<std::ranges::contiguous_range Range>
        requires Vertex<std::ranges::range_value_t<Range>>
        TessBuilder& add_instances(const Range& instances)
        {
            using V = std::ranges::range_value_t<Range>;
            const std::span<const V> span{instances};
            add_raw_vertex_source(instance_sources_, VertexLayout::of<V>(), std::as_bytes(span), span.size());
            return *this;
        }

        // sets the index data, replacing any previously-set index data
        template<std::ranges::contiguous_range Range>
        requires TessIndex<std::ranges::range_value_t<Range>>
        TessBuilder& set_indices(const Range& indices)
        {
            using I = std::ranges::range_value_t<Range>;
            const std::span<const I> span{indices};
            set_raw_index_source(TessIndexTraits<I>::index_type, std::as_bytes(span), span.size());
            return *this;
        }

        // appends an already-created vertex buffer, transferring its ownership to the tessellation
        template<Vertex V>
        TessBuilder& add_vertex_buffer(Buffer<V>&& buffer)
        {
            throw_if_consumed();
            add_buffer_vertex_source(vertex_sources_, VertexLayout::of<V>(), std::move(buffer).release_raw());
            return *this;
        }

        template<Vertex V>
        TessBuilder& add_instance_buffer(Buffer<V>&& buffer)
        {
            throw_if_consumed();
            add_buffer_vertex_source(instance_sources_, VertexLayout::of<V>(), std::move(buffer).release_raw());
            return *this;
        }

        // sets the index buffer, transferring its ownership to the tessellation
        //
        // the buffer must have been created with the `ElementArray` target (the default
        // for index types), because some backends forbid rebinding a buffer to it
        template<TessIndex I>
        TessBuilder& set_index_buffer(Buffer<I>&& buffer)
        {
            throw_if_consumed();
            set_buffer_index_source(TessIndexTraits<I>::index_type, std::move(buffer).release_raw());
            return *this;
        }

        TessBuilder& set_mode(TessMode);

        // overrides the number of vertices (or indices) to render
        TessBuilder& set_vertex_nb(size_t);

        // overrides the number of instances to render
        TessBuilder& set_instance_nb(size_t);

        // enables primitive restart (or disables it, if `std::nullopt`) for the tessellation
        TessBuilder& set_primitive_restart_index(std::optional<uint32_t>);

        // validates the accumulated data and uploads it to the GPU as a `Tess`
        //
        // throws `TessError` on failure, after releasing any resource allocated
        // during the attempt. The builder is consumed either way.
        Tess build() &&;

    private:
        struct ResolvedCounts final {
            size_t vert_nb = 0;
            size_t inst_nb = 0;
        };

        void throw_if_consumed() const;
        void fail();
        void release_sources();
        void on_mutated();
        void add_raw_vertex_source(std::vector<detail::TessVertexSource>&, VertexLayout, std::span<const std::byte>, size_t len);
        void add_buffer_vertex_source(std::vector<detail::TessVertexSource>&, VertexLayout, RawBuffer);
        void set_raw_index_source(TessIndexType, std::span<const std::byte>, size_t len);
        void set_buffer_index_source(TessIndexType, RawBuffer);

        ResolvedCounts validate() const;
        void validate_mode() const;
        void validate_primitive_restart() const;
        void validate_attributes() const;
        ResolvedCounts resolve_counts() const;
        void validate_indices(size_t num_vertices) const;
        Tess upload(const ResolvedCounts&);
        RawBuffer upload_source(std::variant<std::vector<std::byte>, RawBuffer>&, BufferTarget, size_t len, size_t element_size);

        std::shared_ptr<GraphicsState> graphics_state_;
        GraphicsContextParams params_;
        TessBuilderState state_ = TessBuilderState::Empty;
        std::vector<detail::TessVertexSource> vertex_sources_;
        std::vector<detail::TessVertexSource> instance_sources_;
        std::optional<detail::TessIndexSource> index_source_;
        TessMode mode_;
        std::optional<size_t> vert_nb_override_;
        std::optional<size_t> inst_nb_override_;
        std::optional<uint32_t> primitive_restart_index_;
    };
}
