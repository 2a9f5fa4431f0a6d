#pragma once

#include <liblumen/Graphics/TessIndex.h>
#include <liblumen/Graphics/TessMode.h>

#include <cstddef>
#include <optional>

namespace lum
{
    // everything a backend needs to issue one draw submission against the
    // currently-bound vertex array
    struct DrawCommand final {
        friend bool operator==(const DrawCommand&, const DrawCommand&) = default;

        TessMode mode;
        size_t start_index = 0;
        size_t vert_nb = 0;

        // zero means "not instanced"
        size_t inst_nb = 0;

        // `std::nullopt` if the draw is not indexed
        std::optional<TessIndexType> index_type;
    };
}
