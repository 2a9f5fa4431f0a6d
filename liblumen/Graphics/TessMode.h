#pragma once

#include <cstddef>
#include <iosfwd>

namespace lum
{
    // how a tessellation's vertices are connected into primitives
    enum class TessPrimitive {
        Point,
        Line,
        LineStrip,
        Triangle,
        TriangleFan,
        TriangleStrip,
        Patch,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, TessPrimitive);

    // the primitive mode of a tessellation
    //
    // this is a `TessPrimitive` plus, for `TessPrimitive::Patch`, the number of
    // vertices in each patch
    class TessMode final {
    public:
        static constexpr TessMode patch(size_t vertices_per_patch)
        {
            return TessMode{TessPrimitive::Patch, vertices_per_patch};
        }

        constexpr TessMode() = default;

        // implicit, so that callers can write (e.g.) `set_mode(TessPrimitive::Triangle)`
        constexpr TessMode(TessPrimitive primitive) : primitive_{primitive} {}

        friend constexpr bool operator==(const TessMode&, const TessMode&) = default;

        constexpr TessPrimitive primitive() const { return primitive_; }

        // returns the number of vertices per patch, or zero if this isn't a patch mode
        constexpr size_t vertices_per_patch() const { return vertices_per_patch_; }

        constexpr bool is_patch() const { return primitive_ == TessPrimitive::Patch; }

    private:
        constexpr TessMode(TessPrimitive primitive, size_t vertices_per_patch) :
            primitive_{primitive},
            vertices_per_patch_{vertices_per_patch}
        {}

        TessPrimitive primitive_ = TessPrimitive::Triangle;
        size_t vertices_per_patch_ = 0;
    };

    std::ostream& operator<<(std::ostream&, const TessMode&);
}
