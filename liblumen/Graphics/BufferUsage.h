#pragma once

#include <iosfwd>

namespace lum
{
    // a hint to the backend about how a buffer's data store will be accessed
    enum class BufferUsage {
        StreamDraw,
        StaticDraw,
        DynamicDraw,
        NUM_OPTIONS,

        Default = StreamDraw,
    };

    std::ostream& operator<<(std::ostream&, BufferUsage);
}
