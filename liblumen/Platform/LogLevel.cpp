#include "LogLevel.h"

#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <ostream>
#include <string_view>

using namespace lum;

namespace
{
    constexpr auto c_log_level_strings = std::to_array<const char*>({
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    });
    static_assert(c_log_level_strings.size() == num_options<LogLevel>());
}

std::string_view lum::to_string_view(LogLevel level)
{
    return c_log_level_strings.at(to_index(level));
}

std::ostream& lum::operator<<(std::ostream& o, LogLevel level)
{
    return o << to_string_view(level);
}
