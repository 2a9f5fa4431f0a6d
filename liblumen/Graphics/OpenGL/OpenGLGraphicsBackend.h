#pragma once

#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/OpenGL/OpenGLGraphicsBackendParams.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lum
{
    // an `IGraphicsBackend` that issues OpenGL calls against the calling thread's
    // current OpenGL context
    //
    // the caller is responsible for creating the context (e.g. with SDL) and
    // for keeping it current while the backend is in use
    class OpenGLGraphicsBackend final : public IGraphicsBackend {
    public:
        // throws `gl::OpenGLException` if GLEW cannot be initialized
        explicit OpenGLGraphicsBackend(const OpenGLGraphicsBackendParams& = {});

        const OpenGLGraphicsBackendParams& params() const { return params_; }

    private:
        std::string_view impl_name() const final;
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

        OpenGLGraphicsBackendParams params_;
        bool supports_patches_ = false;
    };
}
