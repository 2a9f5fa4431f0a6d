#include "TessMode.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <ostream>
#include <string_view>

using namespace lum;

namespace
{
    constexpr auto c_tess_primitive_strings = std::to_array<std::string_view>({
        "Point",
        "Line",
        "LineStrip",
        "Triangle",
        "TriangleFan",
        "TriangleStrip",
        "Patch",
    });
    static_assert(c_tess_primitive_strings.size() == num_options<TessPrimitive>());
}

std::ostream& lum::operator<<(std::ostream& o, TessPrimitive primitive)
{
    return o << c_tess_primitive_strings.at(to_index(primitive));
}

std::ostream& lum::operator<<(std::ostream& o, const TessMode& mode)
{
    o << mode.primitive();
    if (mode.is_patch()) {
        o << '(' << mode.vertices_per_patch() << ')';
    }
    return o;
}
