#pragma once

#include <liblumen/Graphics/BufferMapAccess.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/NativeHandle.h>

#include <cstddef>
#include <memory>

namespace lum { class GraphicsState; }
namespace lum { class RawBuffer; }

namespace lum
{
    // a scoped mapping of (a range of) a buffer's data store into client memory
    //
    // the buffer is unmapped when the mapping is destroyed, which happens on every
    // exit path (including exceptions). A zero-length mapping never touches the
    // backend and has a `nullptr` `data()`.
    class BufferMapping final {
    public:
        // throws `BufferError` (`MapFailed`) if the backend cannot map the range
        BufferMapping(
            const RawBuffer&,
            size_t byte_offset,
            size_t num_bytes,
            BufferMapAccess
        );
        BufferMapping(const BufferMapping&) = delete;
        BufferMapping(BufferMapping&&) noexcept;
        BufferMapping& operator=(const BufferMapping&) = delete;
        BufferMapping& operator=(BufferMapping&&) noexcept = delete;
        ~BufferMapping() noexcept;

        std::byte* data() const { return data_; }
        size_t size() const { return num_bytes_; }
        BufferMapAccess access() const { return access_; }

    private:
        std::shared_ptr<GraphicsState> state_;
        BufferHandle handle_;
        BufferTarget target_;
        BufferMapAccess access_;
        size_t num_bytes_;
        std::byte* data_ = nullptr;
    };
}
