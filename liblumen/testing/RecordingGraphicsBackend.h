#pragma once

#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Graphics/DrawCommand.h>
#include <liblumen/Graphics/GraphicsBackendState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Graphics/VertexAttributeBinding.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lum::testing
{
    enum class RecordedCallKind {
        CreateBuffer,
        DeleteBuffer,
        BindBuffer,
        AllocateBufferStorage,
        MapBufferRange,
        UnmapBuffer,
        CreateVertexArray,
        DeleteVertexArray,
        BindVertexArray,
        SetVertexAttribute,
        SetPrimitiveRestart,
        Draw,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, RecordedCallKind);

    struct RecordedCall final {
        friend bool operator==(const RecordedCall&, const RecordedCall&) = default;

        RecordedCallKind kind = RecordedCallKind::Draw;

        // the buffer/vertex array handle the call was made with (if applicable)
        uint32_t handle = 0;

        // the buffer target the call was made with (if applicable)
        std::optional<BufferTarget> target;
    };

    // an in-memory `IGraphicsBackend` that records every call made against it
    //
    // it emulates the binding semantics of an OpenGL context (including the
    // element-array binding being part of vertex array state) and stores each
    // buffer's data store in host memory, so that mapping works. It can also be
    // told to fail in various ways.
    class RecordingGraphicsBackend final : public IGraphicsBackend {
    public:
        explicit RecordingGraphicsBackend(GraphicsBackendState initial_state = {});

        const std::vector<RecordedCall>& calls() const { return calls_; }
        size_t count(RecordedCallKind) const;
        size_t count(RecordedCallKind, BufferTarget) const;
        void clear_calls() { calls_.clear(); }

        const std::vector<DrawCommand>& draw_commands() const { return draw_commands_; }
        const std::vector<VertexAttributeBinding>& vertex_attribute_bindings() const { return vertex_attribute_bindings_; }

        size_t num_live_buffers() const { return buffers_.size(); }
        size_t num_live_vertex_arrays() const { return vertex_arrays_.size(); }
        bool is_live(BufferHandle handle) const { return buffers_.contains(handle.get()); }
        bool is_mapped(BufferHandle) const;
        std::span<const std::byte> buffer_data(BufferHandle) const;
        std::optional<BufferUsage> buffer_usage(BufferHandle) const;

        // returns what is really bound (as opposed to what a cache thinks is bound)
        BufferHandle actual_bound_buffer(BufferTarget) const;
        VertexArrayHandle actual_bound_vertex_array() const { return bound_vertex_array_; }
        std::optional<uint32_t> actual_primitive_restart_index() const { return primitive_restart_index_; }

        // returns the element-array buffer recorded in the given vertex array
        BufferHandle element_array_buffer_of(VertexArrayHandle) const;

        // simulates something outside of `liblumen` binding a buffer
        void bind_buffer_behind_the_caches_back(BufferTarget target, BufferHandle handle) { set_actual_binding(target, handle); }

        void set_fail_state_query(bool v) { fail_state_query_ = v; }
        void set_num_buffers_until_creation_fails(std::optional<size_t> n) { num_buffers_until_creation_fails_ = n; }
        void set_fail_storage_allocation(bool v) { fail_storage_allocation_ = v; }
        void set_fail_vertex_array_creation(bool v) { fail_vertex_array_creation_ = v; }
        void set_fail_mapping(bool v) { fail_mapping_ = v; }
        void set_fail_unmapping(bool v) { fail_unmapping_ = v; }

    private:
        struct BufferObject final {
            std::vector<std::byte> data;
            BufferUsage usage = BufferUsage::Default;
            bool mapped = false;
        };

        std::string_view impl_name() const final { return "recording backend"; }
        std::optional<GraphicsBackendState> impl_query_state() final;
        std::optional<BufferHandle> impl_create_buffer() final;
        void impl_delete_buffer(BufferHandle) final;
        void impl_bind_buffer(BufferTarget, BufferHandle) final;
        bool impl_allocate_buffer_storage(BufferTarget, size_t, const void*, BufferUsage) final;
        void* impl_map_buffer_range(BufferTarget, size_t, size_t, BufferMapAccess) final;
        bool impl_unmap_buffer(BufferTarget) final;
        std::optional<VertexArrayHandle> impl_create_vertex_array() final;
        void impl_delete_vertex_array(VertexArrayHandle) final;
        void impl_bind_vertex_array(VertexArrayHandle) final;
        void impl_set_vertex_attribute(const VertexAttributeBinding&) final;
        void impl_set_primitive_restart(std::optional<uint32_t>) final;
        void impl_draw(const DrawCommand&) final;

        void record(RecordedCallKind, uint32_t handle = 0, std::optional<BufferTarget> target = std::nullopt);
        void set_actual_binding(BufferTarget, BufferHandle);
        BufferObject* bound_buffer_object(BufferTarget);

        GraphicsBackendLimits limits_;
        std::vector<RecordedCall> calls_;
        std::vector<DrawCommand> draw_commands_;
        std::vector<VertexAttributeBinding> vertex_attribute_bindings_;

        uint32_t next_handle_ = 1;
        std::unordered_map<uint32_t, BufferObject> buffers_;
        std::unordered_map<uint32_t, BufferHandle> vertex_arrays_;  // vertex array --> element-array buffer

        BufferHandle array_buffer_;
        BufferHandle element_array_buffer_;  // only used when no vertex array is bound
        VertexArrayHandle bound_vertex_array_;
        std::optional<uint32_t> primitive_restart_index_;

        bool fail_state_query_ = false;
        std::optional<size_t> num_buffers_until_creation_fails_;
        bool fail_storage_allocation_ = false;
        bool fail_vertex_array_creation_ = false;
        bool fail_mapping_ = false;
        bool fail_unmapping_ = false;
    };
}
