#pragma once

#include <iosfwd>

namespace lum
{
    // how a bind request should be handled by the `GraphicsState`
    enum class BindMode {
        // only issue the native bind call if the cache doesn't already
        // record the handle as bound to the target
        Cached,

        // always issue the native bind call, regardless of what the cache
        // records. Used at resource-creation time, to defend against bindings
        // that were made outside of the cache's visibility
        Forced,

        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, BindMode);
}
