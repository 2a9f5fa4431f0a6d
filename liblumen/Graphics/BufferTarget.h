#pragma once

#include <iosfwd>

namespace lum
{
    // a binding point in the graphics context that a buffer can be bound to
    enum class BufferTarget {
        Array,
        ElementArray,
        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, BufferTarget);
}
