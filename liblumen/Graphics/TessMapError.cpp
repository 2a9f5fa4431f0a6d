#include "TessMapError.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

using namespace lum;

namespace
{
    constexpr auto c_tess_map_error_kind_strings = std::to_array<std::string_view>({
        "BufferMapError",
        "VertexTypeMismatch",
        "IndexTypeMismatch",
        "ForbiddenAttributelessMapping",
        "ForbiddenDeinterleavedMapping",
    });
    static_assert(c_tess_map_error_kind_strings.size() == num_options<TessMapErrorKind>());

    std::string format_message(TessMapErrorKind kind, const std::string& message)
    {
        std::stringstream ss;
        ss << "tessellation mapping error (" << kind << "): " << message;
        return std::move(ss).str();
    }
}

std::ostream& lum::operator<<(std::ostream& o, TessMapErrorKind kind)
{
    return o << c_tess_map_error_kind_strings.at(to_index(kind));
}

lum::TessMapError::TessMapError(TessMapErrorKind kind, const std::string& message) :
    std::runtime_error{format_message(kind, message)},
    kind_{kind}
{}
