#pragma once

#include <iosfwd>

namespace lum
{
    enum class BufferMapAccess {
        Read,
        Write,
        ReadWrite,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, BufferMapAccess);
}
