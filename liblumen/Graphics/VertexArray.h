#pragma once

#include <liblumen/Graphics/NativeHandle.h>

#include <memory>

namespace lum { class GraphicsState; }

namespace lum
{
    // a move-only, owning handle to one backend vertex array object
    class VertexArray final {
    public:
        // throws `TessError` (`CannotCreate`) if the backend cannot create one
        explicit VertexArray(std::shared_ptr<GraphicsState>);
        VertexArray(const VertexArray&) = delete;
        VertexArray(VertexArray&&) noexcept;
        VertexArray& operator=(const VertexArray&) = delete;
        VertexArray& operator=(VertexArray&&) noexcept;
        ~VertexArray() noexcept;

        VertexArrayHandle handle() const { return handle_; }

        // binds the vertex array, eliding the call if it's already bound
        void bind() const;

    private:
        void destroy() noexcept;

        std::shared_ptr<GraphicsState> state_;
        VertexArrayHandle handle_;
    };
}
