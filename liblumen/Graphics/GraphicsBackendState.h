#pragma once

#include <liblumen/Graphics/NativeHandle.h>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace lum
{
    // capabilities/limits that a backend reports once, when a `GraphicsState` is created
    struct GraphicsBackendLimits final {
        friend bool operator==(const GraphicsBackendLimits&, const GraphicsBackendLimits&) = default;

        size_t max_vertex_attributes = 16;
        bool supports_patches = false;
        size_t max_patch_vertices = 0;

        // `false` if the backend only supports fixed-index primitive restart
        // (i.e. the restart index is always the maximum value of the index type,
        // as in OpenGL ES 3 and WebGL2)
        bool supports_arbitrary_primitive_restart_index = false;
    };

    // a snapshot of the real state of a backend, as reported by the backend
    struct GraphicsBackendState final {
        friend bool operator==(const GraphicsBackendState&, const GraphicsBackendState&) = default;

        BufferHandle array_buffer;
        BufferHandle element_array_buffer;
        VertexArrayHandle vertex_array;

        // `std::nullopt` if primitive restart is disabled
        std::optional<uint32_t> primitive_restart_index;

        GraphicsBackendLimits limits;
    };
}
