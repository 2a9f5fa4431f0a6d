#pragma once

#include <iosfwd>
#include <string_view>

namespace lum
{
    enum class LogLevel {
        trace = 0,
        debug,
        info,
        warn,
        err,
        critical,
        off,
        NUM_OPTIONS,

        DEFAULT = info,
    };

    std::string_view to_string_view(LogLevel);
    std::ostream& operator<<(std::ostream&, LogLevel);
}
