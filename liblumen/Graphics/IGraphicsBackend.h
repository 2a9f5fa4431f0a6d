#pragma once

#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Graphics/DrawCommand.h>
#include <liblumen/Graphics/GraphicsBackendState.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Graphics/VertexAttributeBinding.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lum
{
    // the raw operations that a concrete graphics backend (desktop OpenGL,
    // OpenGL ES 3/WebGL2, etc.) must provide
    //
    // the rest of `liblumen` is written once against this interface. Callers
    // should not use it directly: binds that bypass `GraphicsState` desynchronize
    // its cache from the backend's real state.
    class IGraphicsBackend {
    protected:
        IGraphicsBackend() = default;
        IGraphicsBackend(const IGraphicsBackend&) = default;
        IGraphicsBackend(IGraphicsBackend&&) noexcept = default;
        IGraphicsBackend& operator=(const IGraphicsBackend&) = default;
        IGraphicsBackend& operator=(IGraphicsBackend&&) noexcept = default;
    public:
        virtual ~IGraphicsBackend() noexcept = default;

        // returns a human-readable name for the backend (e.g. for logging)
        std::string_view name() const { return impl_name(); }

        // returns the real, current, state of the backend, or `std::nullopt` if
        // the backend cannot report it
        std::optional<GraphicsBackendState> query_state() { return impl_query_state(); }

        // returns `std::nullopt` if the backend cannot allocate a buffer object
        std::optional<BufferHandle> create_buffer() { return impl_create_buffer(); }
        void delete_buffer(BufferHandle handle) { impl_delete_buffer(handle); }
        void bind_buffer(BufferTarget target, BufferHandle handle) { impl_bind_buffer(target, handle); }

        // (re)allocates the data store of the buffer bound to `target`, copying `num_bytes`
        // from `data` into it, or leaving it uninitialized if `data` is `nullptr`
        //
        // returns `false` if the backend couldn't allocate the data store
        bool allocate_buffer_storage(BufferTarget target, size_t num_bytes, const void* data, BufferUsage usage)
        {
            return impl_allocate_buffer_storage(target, num_bytes, data, usage);
        }

        // maps a range of the buffer bound to `target` into client memory
        //
        // returns `nullptr` if the mapping fails. Mapping is synchronous: it may
        // block until prior GPU writes to the buffer complete.
        void* map_buffer_range(BufferTarget target, size_t byte_offset, size_t num_bytes, BufferMapAccess access)
        {
            return impl_map_buffer_range(target, byte_offset, num_bytes, access);
        }

        // returns `false` if the buffer's data store became corrupt while it was mapped
        bool unmap_buffer(BufferTarget target) { return impl_unmap_buffer(target); }

        std::optional<VertexArrayHandle> create_vertex_array() { return impl_create_vertex_array(); }
        void delete_vertex_array(VertexArrayHandle handle) { impl_delete_vertex_array(handle); }
        void bind_vertex_array(VertexArrayHandle handle) { impl_bind_vertex_array(handle); }

        // configures (and enables) an attribute of the currently-bound vertex array
        // to read from the currently-bound array buffer
        void set_vertex_attribute(const VertexAttributeBinding& binding) { impl_set_vertex_attribute(binding); }

        // enables primitive restart with the given index, or disables it if `std::nullopt`
        void set_primitive_restart(std::optional<uint32_t> restart_index) { impl_set_primitive_restart(restart_index); }

        // issues one draw submission against the currently-bound vertex array
        void draw(const DrawCommand& command) { impl_draw(command); }

    private:
        virtual std::string_view impl_name() const = 0;
        virtual std::optional<GraphicsBackendState> impl_query_state() = 0;
        virtual std::optional<BufferHandle> impl_create_buffer() = 0;
        virtual void impl_delete_buffer(BufferHandle) = 0;
        virtual void impl_bind_buffer(BufferTarget, BufferHandle) = 0;
        virtual bool impl_allocate_buffer_storage(BufferTarget, size_t, const void*, BufferUsage) = 0;
        virtual void* impl_map_buffer_range(BufferTarget, size_t, size_t, BufferMapAccess) = 0;
        virtual bool impl_unmap_buffer(BufferTarget) = 0;
        virtual std::optional<VertexArrayHandle> impl_create_vertex_array() = 0;
        virtual void impl_delete_vertex_array(VertexArrayHandle) = 0;
        virtual void impl_bind_vertex_array(VertexArrayHandle) = 0;
        virtual void impl_set_vertex_attribute(const VertexAttributeBinding&) = 0;
        virtual void impl_set_primitive_restart(std::optional<uint32_t>) = 0;
        virtual void impl_draw(const DrawCommand&) = 0;
    };
}
