#pragma once

#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/BufferUsage.h>
#include <liblumen/Graphics/NativeHandle.h>

#include <cstddef>
#include <memory>

namespace lum { class GraphicsState; }

namespace lum
{
    // an untyped, move-only, owning handle to one backend buffer object
    //
    // a `RawBuffer` is always used with one target (its "home" target), because
    // some backends (e.g. WebGL2) forbid binding an index buffer to any other
    // target. It is destroyed exactly once: the destructor unbinds it (if it is
    // bound) before deleting the native object.
    class RawBuffer final {
    public:
        // allocates a buffer containing `len` elements of `element_size` bytes each
        //
        // - the new buffer is bound to `target` using `creation_bind_mode` before
        //   its data store is allocated
        // - if `data` is `nullptr`, the data store is left uninitialized
        // - throws `BufferError` (`CannotCreate`) if the backend cannot allocate it
        static RawBuffer allocate(
            std::shared_ptr<GraphicsState> state,
            BufferTarget target,
            size_t len,
            size_t element_size,
            const void* data,
            BufferUsage usage,
            BindMode creation_bind_mode = BindMode::Forced
        );

        RawBuffer(const RawBuffer&) = delete;
        RawBuffer(RawBuffer&&) noexcept;
        RawBuffer& operator=(const RawBuffer&) = delete;
        RawBuffer& operator=(RawBuffer&&) noexcept;
        ~RawBuffer() noexcept;

        BufferHandle handle() const { return handle_; }
        BufferTarget target() const { return target_; }

        // returns the number of elements in the buffer
        size_t len() const { return len_; }

        // returns the number of bytes in the buffer (i.e. `len() * element_size()`)
        size_t bytes() const { return len_ * element_size_; }

        size_t element_size() const { return element_size_; }

        GraphicsState& state() const { return *state_; }
        const std::shared_ptr<GraphicsState>& shared_state() const { return state_; }

        // binds the buffer to its home target, eliding the call if it's already bound
        void bind() const;

    private:
        RawBuffer(
            std::shared_ptr<GraphicsState> state,
            BufferHandle handle,
            BufferTarget target,
            size_t len,
            size_t element_size
        );

        void destroy() noexcept;

        std::shared_ptr<GraphicsState> state_;
        BufferHandle handle_;
        BufferTarget target_ = BufferTarget::Array;
        size_t len_ = 0;
        size_t element_size_ = 0;
    };

    // binds `handle` to `target` through `state`
    //
    // binding an element-array buffer modifies whichever vertex array is currently
    // bound, so this first binds "no vertex array" when `target` is `ElementArray`
    void bind_buffer_outside_of_vertex_array(GraphicsState& state, BufferTarget target, BufferHandle handle, BindMode mode);
}
