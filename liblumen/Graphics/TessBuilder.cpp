#include "TessBuilder.h"

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/Graphics/VertexArray.h>
#include <liblumen/Graphics/VertexAttributeBinding.h>
#include <liblumen/Platform/Log.h>
#include <liblumen/Utils/EnumHelpers.h>
#include <liblumen/Utils/ScopeExit.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

using namespace lum;
using lum::detail::TessIndexSource;
using lum::detail::TessVertexSource;

namespace
{
    constexpr auto c_builder_state_strings = std::to_array<std::string_view>({
        "Empty",
        "Accumulating",
        "Built",
        "Failed",
    });
    static_assert(c_builder_state_strings.size() == num_options<TessBuilderState>());

    // returns the length that every source shares, or `std::nullopt` if they disagree
    std::optional<size_t> common_length_of(std::span<const TessVertexSource> sources)
    {
        if (sources.empty()) {
            return std::nullopt;
        }
        const size_t len = sources.front().len;
        const bool all_same = std::ranges::all_of(sources, [len](const TessVertexSource& s) { return s.len == len; });
        return all_same ? std::optional{len} : std::nullopt;
    }

    size_t shortest_length_of(std::span<const TessVertexSource> sources)
    {
        return std::ranges::min_element(sources, {}, &TessVertexSource::len)->len;
    }

    // resolves how many elements (vertices or instances) can be drawn from `sources`
    size_t resolve_count(
        std::span<const TessVertexSource> sources,
        std::optional<size_t> override_nb,
        std::string_view what)
    {
        if (override_nb) {
            if (const size_t shortest = shortest_length_of(sources); *override_nb > shortest) {
                std::stringstream ss;
                ss << "the requested number of " << what << " (" << *override_nb << ") exceeds the " << shortest << ' ' << what << " available";
                throw TessError{TessErrorKind::LengthIncoherency, std::move(ss).str()};
            }
            return *override_nb;
        }

        const std::optional<size_t> common = common_length_of(sources);
        if (not common) {
            std::stringstream ss;
            ss << "the " << what << " buffers have different lengths (";
            std::string_view delim;
            for (const TessVertexSource& source : sources) {
                ss << delim << source.len;
                delim = ", ";
            }
            ss << "): set the number of " << what << " explicitly";
            throw TessError{TessErrorKind::LengthIncoherency, std::move(ss).str()};
        }
        return *common;
    }

    template<TessIndex I>
    std::optional<uint32_t> find_out_of_range_index(
        std::span<const std::byte> bytes,
        size_t num_vertices,
        std::optional<uint32_t> restart_index)
    {
        for (size_t offset = 0; offset + sizeof(I) <= bytes.size(); offset += sizeof(I)) {
            I index{};
            std::memcpy(&index, bytes.data() + offset, sizeof(I));

            const auto value = static_cast<uint32_t>(index);
            if (restart_index and value == *restart_index) {
                continue;
            }
            if (value >= num_vertices) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<uint32_t> find_out_of_range_index(
        TessIndexType index_type,
        std::span<const std::byte> bytes,
        size_t num_vertices,
        std::optional<uint32_t> restart_index)
    {
        switch (index_type) {
        case TessIndexType::U8:  return find_out_of_range_index<uint8_t>(bytes, num_vertices, restart_index);
        case TessIndexType::U16: return find_out_of_range_index<uint16_t>(bytes, num_vertices, restart_index);
        case TessIndexType::U32: return find_out_of_range_index<uint32_t>(bytes, num_vertices, restart_index);
        default:                 return std::nullopt;
        }
    }
}

std::ostream& lum::operator<<(std::ostream& o, TessBuilderState state)
{
    return o << c_builder_state_strings.at(to_index(state));
}

lum::TessBuilder::TessBuilder(std::shared_ptr<GraphicsState> state, const GraphicsContextParams& params) :
    graphics_state_{std::move(state)},
    params_{params}
{}

// a moved-from builder behaves as if it was consumed
lum::TessBuilder::TessBuilder(TessBuilder&& tmp) noexcept :
    graphics_state_{std::move(tmp.graphics_state_)},
    params_{tmp.params_},
    state_{std::exchange(tmp.state_, TessBuilderState::Failed)},
    vertex_sources_{std::move(tmp.vertex_sources_)},
    instance_sources_{std::move(tmp.instance_sources_)},
    index_source_{std::exchange(tmp.index_source_, std::nullopt)},
    mode_{tmp.mode_},
    vert_nb_override_{tmp.vert_nb_override_},
    inst_nb_override_{tmp.inst_nb_override_},
    primitive_restart_index_{tmp.primitive_restart_index_}
{}

TessBuilder& lum::TessBuilder::operator=(TessBuilder&& tmp) noexcept
{
    if (&tmp != this) {
        graphics_state_ = std::move(tmp.graphics_state_);
        params_ = tmp.params_;
        state_ = std::exchange(tmp.state_, TessBuilderState::Failed);
        vertex_sources_ = std::move(tmp.vertex_sources_);
        instance_sources_ = std::move(tmp.instance_sources_);
        index_source_ = std::exchange(tmp.index_source_, std::nullopt);
        mode_ = tmp.mode_;
        vert_nb_override_ = tmp.vert_nb_override_;
        inst_nb_override_ = tmp.inst_nb_override_;
        primitive_restart_index_ = tmp.primitive_restart_index_;
    }
    return *this;
}
lum::TessBuilder::~TessBuilder() noexcept = default;

TessBuilder& lum::TessBuilder::set_mode(TessMode mode)
{
    throw_if_consumed();
    mode_ = mode;
    on_mutated();
    return *this;
}

TessBuilder& lum::TessBuilder::set_vertex_nb(size_t vert_nb)
{
    throw_if_consumed();
    vert_nb_override_ = vert_nb;
    on_mutated();
    return *this;
}

TessBuilder& lum::TessBuilder::set_instance_nb(size_t inst_nb)
{
    throw_if_consumed();
    inst_nb_override_ = inst_nb;
    on_mutated();
    return *this;
}

TessBuilder& lum::TessBuilder::set_primitive_restart_index(std::optional<uint32_t> restart_index)
{
    throw_if_consumed();
    primitive_restart_index_ = restart_index;
    on_mutated();
    return *this;
}

Tess lum::TessBuilder::build() &&
{
    throw_if_consumed();

    // the builder is consumed whatever happens, so release everything it holds on exit
    const ScopeExit on_exit{[this]() { release_sources(); }};
    state_ = TessBuilderState::Failed;

    try {
        const ResolvedCounts counts = validate();
        Tess rv = upload(counts);
        state_ = TessBuilderState::Built;
        return rv;
    }
    catch (const std::exception& ex) {
        log_warn("failed to build a tessellation: %s", ex.what());
        throw;
    }
}

void lum::TessBuilder::throw_if_consumed() const
{
    if (state_ == TessBuilderState::Built or state_ == TessBuilderState::Failed) {
        std::stringstream ss;
        ss << "the tessellation builder was already consumed (state = " << state_ << ')';
        throw TessError{TessErrorKind::BuilderConsumed, std::move(ss).str()};
    }
}

void lum::TessBuilder::fail()
{
    state_ = TessBuilderState::Failed;
    release_sources();
}

void lum::TessBuilder::release_sources()
{
    vertex_sources_.clear();
    instance_sources_.clear();
    index_source_.reset();
}

void lum::TessBuilder::on_mutated()
{
    state_ = TessBuilderState::Accumulating;
}

void lum::TessBuilder::add_raw_vertex_source(
    std::vector<TessVertexSource>& sources,
    VertexLayout layout,
    std::span<const std::byte> bytes,
    size_t len)
{
    throw_if_consumed();
    sources.push_back(TessVertexSource{
        .layout = std::move(layout),
        .len = len,
        .data = std::vector<std::byte>(bytes.begin(), bytes.end()),
    });
    on_mutated();
}

void lum::TessBuilder::add_buffer_vertex_source(
    std::vector<TessVertexSource>& sources,
    VertexLayout layout,
    RawBuffer buffer)
{
    if (buffer.target() != BufferTarget::Array) {
        fail();
        throw TessError{TessErrorKind::CannotCreate, "vertex and instance buffers must be created with the Array buffer target"};
    }

    const size_t len = buffer.len();
    sources.push_back(TessVertexSource{
        .layout = std::move(layout),
        .len = len,
        .data = std::move(buffer),
    });
    on_mutated();
}

void lum::TessBuilder::set_raw_index_source(TessIndexType index_type, std::span<const std::byte> bytes, size_t len)
{
    throw_if_consumed();
    index_source_ = TessIndexSource{
        .index_type = index_type,
        .len = len,
        .data = std::vector<std::byte>(bytes.begin(), bytes.end()),
    };
    on_mutated();
}

void lum::TessBuilder::set_buffer_index_source(TessIndexType index_type, RawBuffer buffer)
{
    if (buffer.target() != BufferTarget::ElementArray) {
        fail();
        throw TessError{TessErrorKind::CannotCreate, "index buffers must be created with the ElementArray buffer target"};
    }

    const size_t len = buffer.len();
    index_source_ = TessIndexSource{
        .index_type = index_type,
        .len = len,
        .data = std::move(buffer),
    };
    on_mutated();
}

TessBuilder::ResolvedCounts lum::TessBuilder::validate() const
{
    validate_mode();
    validate_primitive_restart();
    validate_attributes();
    const ResolvedCounts counts = resolve_counts();
    if (not vertex_sources_.empty()) {
        validate_indices(vertex_sources_.front().len);
    }
    return counts;
}

void lum::TessBuilder::validate_mode() const
{
    if (not mode_.is_patch()) {
        return;
    }

    const GraphicsBackendLimits& limits = graphics_state_->limits();
    if (not limits.supports_patches) {
        throw TessError{TessErrorKind::UnsupportedMode, "the graphics backend does not support patch tessellations"};
    }
    if (mode_.vertices_per_patch() == 0 or mode_.vertices_per_patch() > limits.max_patch_vertices) {
        std::stringstream ss;
        ss << mode_ << ": the number of vertices per patch must be in the range [1, " << limits.max_patch_vertices << ']';
        throw TessError{TessErrorKind::UnsupportedMode, std::move(ss).str()};
    }
}

void lum::TessBuilder::validate_primitive_restart() const
{
    if (not primitive_restart_index_) {
        return;
    }

    if (not index_source_) {
        throw TessError{TessErrorKind::ForbiddenPrimitiveRestart, "primitive restart requires index data"};
    }

    const uint32_t sentinel = primitive_restart_sentinel_of(index_source_->index_type);
    if (*primitive_restart_index_ != sentinel and not graphics_state_->limits().supports_arbitrary_primitive_restart_index) {
        std::stringstream ss;
        ss << "the graphics backend only supports a primitive restart index of " << sentinel << " for " << index_source_->index_type << " indices (requested: " << *primitive_restart_index_ << ')';
        throw TessError{TessErrorKind::ForbiddenPrimitiveRestart, std::move(ss).str()};
    }
}

void lum::TessBuilder::validate_attributes() const
{
    const size_t max_attributes = graphics_state_->limits().max_vertex_attributes;

    size_t num_attributes = 0;
    std::unordered_set<uint32_t> locations;
    for (const auto* sources : {&vertex_sources_, &instance_sources_}) {
        for (const TessVertexSource& source : *sources) {
            for (const VertexAttributeDescriptor& attribute : source.layout.attributes()) {
                if (attribute.location() >= max_attributes) {
                    std::stringstream ss;
                    ss << attribute << ": the attribute's location exceeds the graphics backend's maximum vertex attribute location (" << max_attributes - 1 << ')';
                    throw TessError{TessErrorKind::CannotCreate, std::move(ss).str()};
                }
                if (not locations.insert(attribute.location()).second) {
                    std::stringstream ss;
                    ss << "more than one vertex attribute uses location " << attribute.location();
                    throw TessError{TessErrorKind::CannotCreate, std::move(ss).str()};
                }
                ++num_attributes;
            }
        }
    }

    if (num_attributes > max_attributes) {
        std::stringstream ss;
        ss << "the tessellation uses " << num_attributes << " vertex attributes, but the graphics backend only supports " << max_attributes;
        throw TessError{TessErrorKind::CannotCreate, std::move(ss).str()};
    }
}

TessBuilder::ResolvedCounts lum::TessBuilder::resolve_counts() const
{
    ResolvedCounts rv;

    if (index_source_) {
        // the index buffer addresses every vertex buffer
        if (not vertex_sources_.empty() and not common_length_of(vertex_sources_)) {
            throw TessError{TessErrorKind::LengthIncoherency, "the vertex buffers of an indexed tessellation must all have the same length"};
        }
        if (vert_nb_override_ and *vert_nb_override_ > index_source_->len) {
            std::stringstream ss;
            ss << "the requested number of vertices (" << *vert_nb_override_ << ") exceeds the number of indices (" << index_source_->len << ')';
            throw TessError{TessErrorKind::LengthIncoherency, std::move(ss).str()};
        }
        rv.vert_nb = vert_nb_override_.value_or(index_source_->len);
    }
    else if (not vertex_sources_.empty()) {
        rv.vert_nb = resolve_count(vertex_sources_, vert_nb_override_, "vertices");
    }
    else if (vert_nb_override_) {
        rv.vert_nb = *vert_nb_override_;  // attributeless
    }
    else {
        throw TessError{TessErrorKind::NoData, "the tessellation has no vertex data, no index data, and no explicit number of vertices"};
    }

    if (not vert_nb_override_ and rv.vert_nb == 0) {
        throw TessError{TessErrorKind::NoData, "the tessellation has zero vertices"};
    }

    if (not instance_sources_.empty()) {
        rv.inst_nb = resolve_count(instance_sources_, inst_nb_override_, "instances");
    }
    else {
        rv.inst_nb = inst_nb_override_.value_or(0);
    }

    // without an explicit count, per-vertex and per-instance data must agree
    if (not vert_nb_override_ and not inst_nb_override_ and not vertex_sources_.empty() and not instance_sources_.empty()) {
        const size_t num_vertices = vertex_sources_.front().len;
        const size_t num_instances = instance_sources_.front().len;
        if (num_vertices != num_instances) {
            std::stringstream ss;
            ss << "the vertex data (" << num_vertices << " vertices) and instance data (" << num_instances << " instances) have different lengths: set the number of vertices or instances explicitly";
            throw TessError{TessErrorKind::LengthIncoherency, std::move(ss).str()};
        }
    }

    return rv;
}

void lum::TessBuilder::validate_indices(size_t num_vertices) const
{
    if (not index_source_) {
        return;
    }

    // indices that are already on the GPU cannot be checked without mapping them
    const auto* bytes = std::get_if<std::vector<std::byte>>(&index_source_->data);
    if (not bytes) {
        return;
    }

    if (const auto bad_index = find_out_of_range_index(index_source_->index_type, *bytes, num_vertices, primitive_restart_index_)) {
        std::stringstream ss;
        ss << "the index " << *bad_index << " addresses a vertex outside of the tessellation's " << num_vertices << " vertices";
        throw TessError{TessErrorKind::IndexOutOfRange, std::move(ss).str()};
    }
}

Tess lum::TessBuilder::upload(const ResolvedCounts& counts)
{
    // upload (or take ownership of) every buffer
    std::vector<detail::TessVertexBuffer> vertex_buffers;
    vertex_buffers.reserve(vertex_sources_.size());
    for (TessVertexSource& source : vertex_sources_) {
        RawBuffer buffer = upload_source(source.data, BufferTarget::Array, source.len, source.layout.stride());
        vertex_buffers.push_back({std::move(source.layout), std::move(buffer)});
    }

    std::vector<detail::TessVertexBuffer> instance_buffers;
    instance_buffers.reserve(instance_sources_.size());
    for (TessVertexSource& source : instance_sources_) {
        RawBuffer buffer = upload_source(source.data, BufferTarget::Array, source.len, source.layout.stride());
        instance_buffers.push_back({std::move(source.layout), std::move(buffer)});
    }

    std::optional<detail::TessIndexBuffer> index_buffer;
    if (index_source_) {
        RawBuffer buffer = upload_source(index_source_->data, BufferTarget::ElementArray, index_source_->len, size_of(index_source_->index_type));
        index_buffer.emplace(detail::TessIndexBuffer{index_source_->index_type, std::move(buffer)});
    }

    // record how each buffer is read in a new vertex array
    VertexArray vertex_array{graphics_state_};
    vertex_array.bind();

    for (const auto [buffers, divisor] : {std::pair{&vertex_buffers, 0u}, std::pair{&instance_buffers, 1u}}) {
        for (const detail::TessVertexBuffer& vb : *buffers) {
            graphics_state_->bind_buffer(BufferTarget::Array, vb.buffer.handle(), BindMode::Cached);
            for (const VertexAttributeDescriptor& attribute : vb.layout.attributes()) {
                graphics_state_->backend().set_vertex_attribute(VertexAttributeBinding{
                    .location = attribute.location(),
                    .format = attribute.format(),
                    .stride = vb.layout.stride(),
                    .offset = attribute.offset(),
                    .divisor = divisor,
                });
            }
        }
    }

    if (index_buffer) {
        graphics_state_->bind_buffer(BufferTarget::ElementArray, index_buffer->buffer.handle(), BindMode::Cached);
    }

    const std::optional<uint32_t> primitive_restart_index = index_buffer ? primitive_restart_index_ : std::nullopt;

    std::stringstream mode_string;
    mode_string << mode_;
    log_debug("built a tessellation (mode = %s, vertices = %zu, instances = %zu, vertex buffers = %zu, instance buffers = %zu, indexed = %s)",
        std::move(mode_string).str().c_str(),
        counts.vert_nb,
        counts.inst_nb,
        vertex_buffers.size(),
        instance_buffers.size(),
        index_buffer ? "yes" : "no"
    );

    return Tess{
        graphics_state_,
        std::move(vertex_array),
        std::move(vertex_buffers),
        std::move(instance_buffers),
        std::move(index_buffer),
        mode_,
        counts.vert_nb,
        counts.inst_nb,
        primitive_restart_index,
    };
}

RawBuffer lum::TessBuilder::upload_source(
    std::variant<std::vector<std::byte>, RawBuffer>& data,
    BufferTarget target,
    size_t len,
    size_t element_size)
{
    if (auto* buffer = std::get_if<RawBuffer>(&data)) {
        return std::move(*buffer);
    }

    const auto& bytes = std::get<std::vector<std::byte>>(data);
    try {
        return RawBuffer::allocate(
            graphics_state_,
            target,
            len,
            element_size,
            bytes.empty() ? nullptr : bytes.data(),
            params_.default_buffer_usage,
            params_.creation_bind_mode
        );
    }
    catch (const BufferError& ex) {
        throw TessError{TessErrorKind::CannotCreate, ex.what()};
    }
}
