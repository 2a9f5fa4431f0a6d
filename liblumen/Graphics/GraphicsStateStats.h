#pragma once

#include <cstddef>

namespace lum
{
    // counters that a `GraphicsState` maintains about the bind requests it handled
    struct GraphicsStateStats final {
        friend bool operator==(const GraphicsStateStats&, const GraphicsStateStats&) = default;

        size_t num_buffer_binds_issued = 0;
        size_t num_buffer_binds_elided = 0;
        size_t num_vertex_array_binds_issued = 0;
        size_t num_vertex_array_binds_elided = 0;
        size_t num_primitive_restart_changes_issued = 0;
        size_t num_primitive_restart_changes_elided = 0;
    };
}
