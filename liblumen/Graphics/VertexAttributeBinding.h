#pragma once

#include <liblumen/Graphics/VertexAttributeFormat.h>

#include <cstddef>
#include <cstdint>

namespace lum
{
    // describes how one shader attribute location reads its data from the
    // currently-bound array buffer (i.e. the arguments to `glVertexAttribPointer`
    // and `glVertexAttribDivisor`)
    struct VertexAttributeBinding final {
        friend bool operator==(const VertexAttributeBinding&, const VertexAttributeBinding&) = default;

        uint32_t location = 0;
        VertexAttributeFormat format = VertexAttributeFormat::Float32x3;
        size_t stride = 0;
        size_t offset = 0;

        // zero for per-vertex data, one for per-instance data
        uint32_t divisor = 0;
    };
}
