#include "Tess.h"

#include <liblumen/Graphics/TessMapError.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

using namespace lum;

lum::Tess::Tess(
    std::shared_ptr<GraphicsState> state,
    VertexArray vertex_array,
    std::vector<detail::TessVertexBuffer> vertex_buffers,
    std::vector<detail::TessVertexBuffer> instance_buffers,
    std::optional<detail::TessIndexBuffer> index_buffer,
    TessMode mode,
    size_t vert_nb,
    size_t inst_nb,
    std::optional<uint32_t> primitive_restart_index) :

    state_{std::move(state)},
    vertex_buffers_{std::move(vertex_buffers)},
    instance_buffers_{std::move(instance_buffers)},
    index_buffer_{std::move(index_buffer)},
    vertex_array_{std::move(vertex_array)},
    mode_{mode},
    vert_nb_{vert_nb},
    inst_nb_{inst_nb},
    primitive_restart_index_{primitive_restart_index}
{}

const RawBuffer& lum::Tess::mappable_buffer(
    std::span<const detail::TessVertexBuffer> buffers,
    std::type_index requested_type,
    std::string_view buffer_kind)
{
    if (buffers.empty()) {
        std::stringstream ss;
        ss << "cannot map the " << buffer_kind << " data of a tessellation that has no " << buffer_kind << " buffer";
        throw TessMapError{TessMapErrorKind::ForbiddenAttributelessMapping, std::move(ss).str()};
    }
    if (buffers.size() > 1) {
        std::stringstream ss;
        ss << "cannot map the " << buffer_kind << " data of a tessellation that has " << buffers.size() << " (deinterleaved) " << buffer_kind << " buffers";
        throw TessMapError{TessMapErrorKind::ForbiddenDeinterleavedMapping, std::move(ss).str()};
    }
    if (buffers.front().layout.vertex_type() != requested_type) {
        std::stringstream ss;
        ss << "cannot map " << buffer_kind << " data of type " << buffers.front().layout.vertex_type().name() << " as " << requested_type.name();
        throw TessMapError{TessMapErrorKind::VertexTypeMismatch, std::move(ss).str()};
    }
    return buffers.front().buffer;
}

const RawBuffer& lum::Tess::mappable_index_buffer(TessIndexType requested_type) const
{
    if (not index_buffer_) {
        throw TessMapError{TessMapErrorKind::ForbiddenAttributelessMapping, "cannot map the indices of a tessellation that has no index buffer"};
    }
    if (index_buffer_->index_type != requested_type) {
        std::stringstream ss;
        ss << "cannot map indices of type " << index_buffer_->index_type << " as " << requested_type;
        throw TessMapError{TessMapErrorKind::IndexTypeMismatch, std::move(ss).str()};
    }
    return index_buffer_->buffer;
}
