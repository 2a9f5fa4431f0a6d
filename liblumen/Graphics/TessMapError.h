#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>

namespace lum
{
    enum class TessMapErrorKind {
        // the underlying buffer couldn't be mapped
        BufferMapError,

        // the tessellation's vertex (or instance) data has a different type from
        // the one requested
        VertexTypeMismatch,

        // the tessellation's index data has a different type from the one requested
        IndexTypeMismatch,

        // the tessellation has no data of the requested kind
        ForbiddenAttributelessMapping,

        // the tessellation has more than one buffer of the requested kind
        ForbiddenDeinterleavedMapping,

        NUM_OPTIONS,
    };

    std::ostream& operator<<(std::ostream&, TessMapErrorKind);

    // thrown when mapping a tessellation's underlying buffers for CPU access fails
    class TessMapError final : public std::runtime_error {
    public:
        TessMapError(TessMapErrorKind kind, const std::string& message);

        TessMapErrorKind kind() const { return kind_; }

    private:
        TessMapErrorKind kind_;
    };
}
