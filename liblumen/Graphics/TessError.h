#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace lum
{
    enum class TessErrorKind {
        // the backend couldn't allocate a resource, or the requested layout
        // exceeds what the backend can support
        CannotCreate,

        // there is no vertex data, no index data, and no explicit vertex count
        NoData,

        // the attached buffers disagree on how many vertices/instances there are,
        // or an explicit count exceeds the available data
        LengthIncoherency,

        // an index addresses a vertex that doesn't exist
        IndexOutOfRange,

        // the mode isn't supported by the backend (e.g. patches on WebGL2)
        UnsupportedMode,

        // primitive restart was requested in a way that the backend (or the
        // tessellation's data) cannot support
        ForbiddenPrimitiveRestart,

        // a `TessView` addresses vertices outside of its tessellation
        ViewOutOfRange,

        // the builder was already consumed by a call to `build`
        BuilderConsumed,

        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, TessErrorKind);

    // thrown when a tessellation cannot be built or rendered
    class TessError final : public std::runtime_error {
    public:
        TessError(TessErrorKind kind, const std::string& message);

        TessErrorKind kind() const { return kind_; }

    private:
        TessErrorKind kind_;
    };
}
