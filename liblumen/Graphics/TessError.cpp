#include "TessError.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

using namespace lum;

namespace
{
    constexpr auto c_tess_error_kind_strings = std::to_array<std::string_view>({
        "CannotCreate",
        "NoData",
        "LengthIncoherency",
        "IndexOutOfRange",
        "UnsupportedMode",
        "ForbiddenPrimitiveRestart",
        "ViewOutOfRange",
        "BuilderConsumed",
    });
    static_assert(c_tess_error_kind_strings.size() == num_options<TessErrorKind>());

    std::string format_message(TessErrorKind kind, const std::string& message)
    {
        std::stringstream ss;
        ss << "tessellation error (" << kind << "): " << message;
        return std::move(ss).str();
    }
}

std::ostream& lum::operator<<(std::ostream& o, TessErrorKind kind)
{
    return o << c_tess_error_kind_strings.at(to_index(kind));
}

lum::TessError::TessError(TessErrorKind kind, const std::string& message) :
    std::runtime_error{format_message(kind, message)},
    kind_{kind}
{}
