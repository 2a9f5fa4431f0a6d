#include "RecordingGraphicsBackend.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>

using namespace lum;
using namespace lum::testing;

namespace
{
    constexpr auto c_recorded_call_kind_strings = std::to_array<std::string_view>({
        "CreateBuffer",
        "DeleteBuffer",
        "BindBuffer",
        "AllocateBufferStorage",
        "MapBufferRange",
        "UnmapBuffer",
        "CreateVertexArray",
        "DeleteVertexArray",
        "BindVertexArray",
        "SetVertexAttribute",
        "SetPrimitiveRestart",
        "Draw",
    });
    static_assert(c_recorded_call_kind_strings.size() == static_cast<size_t>(RecordedCallKind::NUM_OPTIONS));
}

std::ostream& lum::testing::operator<<(std::ostream& o, RecordedCallKind kind)
{
    return o << c_recorded_call_kind_strings.at(static_cast<size_t>(kind));
}

lum::testing::RecordingGraphicsBackend::RecordingGraphicsBackend(GraphicsBackendState initial_state) :
    limits_{initial_state.limits},
    array_buffer_{initial_state.array_buffer},
    element_array_buffer_{initial_state.element_array_buffer},
    bound_vertex_array_{initial_state.vertex_array},
    primitive_restart_index_{initial_state.primitive_restart_index}
{
    // pre-existing (application-owned) objects must not collide with newly-created ones
    next_handle_ = 1 + std::max({
        initial_state.array_buffer.get(),
        initial_state.element_array_buffer.get(),
        initial_state.vertex_array.get(),
        uint32_t{0},
    });
    if (bound_vertex_array_) {
        vertex_arrays_[bound_vertex_array_.get()] = element_array_buffer_;
    }
}

size_t lum::testing::RecordingGraphicsBackend::count(RecordedCallKind kind) const
{
    return static_cast<size_t>(std::ranges::count(calls_, kind, &RecordedCall::kind));
}

size_t lum::testing::RecordingGraphicsBackend::count(RecordedCallKind kind, BufferTarget target) const
{
    return static_cast<size_t>(std::ranges::count_if(calls_, [kind, target](const RecordedCall& c)
    {
        return c.kind == kind and c.target == target;
    }));
}

bool lum::testing::RecordingGraphicsBackend::is_mapped(BufferHandle handle) const
{
    const auto it = buffers_.find(handle.get());
    return it != buffers_.end() and it->second.mapped;
}

std::span<const std::byte> lum::testing::RecordingGraphicsBackend::buffer_data(BufferHandle handle) const
{
    const auto it = buffers_.find(handle.get());
    if (it == buffers_.end()) {
        return {};
    }
    return it->second.data;
}

std::optional<BufferUsage> lum::testing::RecordingGraphicsBackend::buffer_usage(BufferHandle handle) const
{
    const auto it = buffers_.find(handle.get());
    if (it == buffers_.end()) {
        return std::nullopt;
    }
    return it->second.usage;
}

BufferHandle lum::testing::RecordingGraphicsBackend::actual_bound_buffer(BufferTarget target) const
{
    switch (target) {
    case BufferTarget::Array:
        return array_buffer_;
    case BufferTarget::ElementArray:
        return bound_vertex_array_ ? element_array_buffer_of(bound_vertex_array_) : element_array_buffer_;
    default:
        return BufferHandle{};
    }
}

BufferHandle lum::testing::RecordingGraphicsBackend::element_array_buffer_of(VertexArrayHandle vao) const
{
    const auto it = vertex_arrays_.find(vao.get());
    return it != vertex_arrays_.end() ? it->second : BufferHandle{};
}

std::optional<GraphicsBackendState> lum::testing::RecordingGraphicsBackend::impl_query_state()
{
    if (fail_state_query_) {
        return std::nullopt;
    }
    return GraphicsBackendState{
        .array_buffer = array_buffer_,
        .element_array_buffer = actual_bound_buffer(BufferTarget::ElementArray),
        .vertex_array = bound_vertex_array_,
        .primitive_restart_index = primitive_restart_index_,
        .limits = limits_,
    };
}

std::optional<BufferHandle> lum::testing::RecordingGraphicsBackend::impl_create_buffer()
{
    record(RecordedCallKind::CreateBuffer);

    if (num_buffers_until_creation_fails_) {
        if (*num_buffers_until_creation_fails_ == 0) {
            return std::nullopt;
        }
        --*num_buffers_until_creation_fails_;
    }

    const BufferHandle handle{next_handle_++};
    buffers_.try_emplace(handle.get());
    return handle;
}

void lum::testing::RecordingGraphicsBackend::impl_delete_buffer(BufferHandle handle)
{
    record(RecordedCallKind::DeleteBuffer, handle.get());

    // as in OpenGL: deleting a bound buffer reverts the binding to zero
    if (array_buffer_ == handle) {
        array_buffer_ = BufferHandle{};
    }
    if (bound_vertex_array_ and vertex_arrays_[bound_vertex_array_.get()] == handle) {
        vertex_arrays_[bound_vertex_array_.get()] = BufferHandle{};
    }
    if (element_array_buffer_ == handle) {
        element_array_buffer_ = BufferHandle{};
    }
    buffers_.erase(handle.get());
}

void lum::testing::RecordingGraphicsBackend::impl_bind_buffer(BufferTarget target, BufferHandle handle)
{
    record(RecordedCallKind::BindBuffer, handle.get(), target);
    set_actual_binding(target, handle);
}

bool lum::testing::RecordingGraphicsBackend::impl_allocate_buffer_storage(BufferTarget target, size_t num_bytes, const void* data, BufferUsage usage)
{
    record(RecordedCallKind::AllocateBufferStorage, actual_bound_buffer(target).get(), target);

    BufferObject* buffer = bound_buffer_object(target);
    if (fail_storage_allocation_ or buffer == nullptr) {
        return false;
    }

    buffer->data.assign(num_bytes, std::byte{0});
    if (data != nullptr and num_bytes > 0) {
        std::memcpy(buffer->data.data(), data, num_bytes);
    }
    buffer->usage = usage;
    return true;
}

void* lum::testing::RecordingGraphicsBackend::impl_map_buffer_range(BufferTarget target, size_t byte_offset, size_t num_bytes, BufferMapAccess)
{
    record(RecordedCallKind::MapBufferRange, actual_bound_buffer(target).get(), target);

    BufferObject* buffer = bound_buffer_object(target);
    if (fail_mapping_ or buffer == nullptr or buffer->mapped or byte_offset + num_bytes > buffer->data.size()) {
        return nullptr;
    }

    buffer->mapped = true;
    return buffer->data.data() + byte_offset;
}

bool lum::testing::RecordingGraphicsBackend::impl_unmap_buffer(BufferTarget target)
{
    record(RecordedCallKind::UnmapBuffer, actual_bound_buffer(target).get(), target);

    BufferObject* buffer = bound_buffer_object(target);
    if (buffer == nullptr or not buffer->mapped) {
        return false;
    }
    buffer->mapped = false;
    return not fail_unmapping_;
}

std::optional<VertexArrayHandle> lum::testing::RecordingGraphicsBackend::impl_create_vertex_array()
{
    record(RecordedCallKind::CreateVertexArray);

    if (fail_vertex_array_creation_) {
        return std::nullopt;
    }

    const VertexArrayHandle handle{next_handle_++};
    vertex_arrays_[handle.get()] = BufferHandle{};
    return handle;
}

void lum::testing::RecordingGraphicsBackend::impl_delete_vertex_array(VertexArrayHandle handle)
{
    record(RecordedCallKind::DeleteVertexArray, handle.get());

    if (bound_vertex_array_ == handle) {
        bound_vertex_array_ = VertexArrayHandle{};
    }
    vertex_arrays_.erase(handle.get());
}

void lum::testing::RecordingGraphicsBackend::impl_bind_vertex_array(VertexArrayHandle handle)
{
    record(RecordedCallKind::BindVertexArray, handle.get());
    bound_vertex_array_ = handle;
}

void lum::testing::RecordingGraphicsBackend::impl_set_vertex_attribute(const VertexAttributeBinding& binding)
{
    record(RecordedCallKind::SetVertexAttribute, array_buffer_.get(), BufferTarget::Array);
    vertex_attribute_bindings_.push_back(binding);
}

void lum::testing::RecordingGraphicsBackend::impl_set_primitive_restart(std::optional<uint32_t> restart_index)
{
    record(RecordedCallKind::SetPrimitiveRestart);
    primitive_restart_index_ = restart_index;
}

void lum::testing::RecordingGraphicsBackend::impl_draw(const DrawCommand& command)
{
    record(RecordedCallKind::Draw, bound_vertex_array_.get());
    draw_commands_.push_back(command);
}

void lum::testing::RecordingGraphicsBackend::record(RecordedCallKind kind, uint32_t handle, std::optional<BufferTarget> target)
{
    calls_.push_back(RecordedCall{.kind = kind, .handle = handle, .target = target});
}

void lum::testing::RecordingGraphicsBackend::set_actual_binding(BufferTarget target, BufferHandle handle)
{
    switch (target) {
    case BufferTarget::Array:
        array_buffer_ = handle;
        break;
    case BufferTarget::ElementArray:
        if (bound_vertex_array_) {
            vertex_arrays_[bound_vertex_array_.get()] = handle;
        }
        else {
            element_array_buffer_ = handle;
        }
        break;
    default:
        break;
    }
}

RecordingGraphicsBackend::BufferObject* lum::testing::RecordingGraphicsBackend::bound_buffer_object(BufferTarget target)
{
    const BufferHandle handle = actual_bound_buffer(target);
    const auto it = buffers_.find(handle.get());
    return it != buffers_.end() ? &it->second : nullptr;
}
