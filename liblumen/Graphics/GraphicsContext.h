#pragma once

#include <liblumen/Graphics/Buffer.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/GraphicsContextParams.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Graphics/TessBuilder.h>
#include <liblumen/Graphics/TessGate.h>
#include <liblumen/Graphics/TessIndex.h>

#include <cstddef>
#include <memory>
#include <ranges>
#include <span>
#include <type_traits>

namespace lum { class GraphicsState; }
namespace lum { class IGraphicsBackend; }

namespace lum
{
    // returns the target that a buffer of `T` is bound to by default
    //
    // index types go to `ElementArray`, so that they can be used as index buffers
    template<typename T>
    constexpr BufferTarget default_buffer_target_for()
    {
        return TessIndex<T> ? BufferTarget::ElementArray : BufferTarget::Array;
    }

    // the application-facing handle to one (stateful) graphics backend context
    //
    // owns the `GraphicsState` that every buffer, tessellation, and gate created
    // from the context shares. Resources hold a shared reference to that state, so
    // they may outlive the `GraphicsContext` itself. Not thread-safe.
    class GraphicsContext final {
    public:
        // throws `StateQueryError` if the backend cannot report its initial state
        explicit GraphicsContext(
            std::shared_ptr<IGraphicsBackend>,
            const GraphicsContextParams& = {}
        );

        const GraphicsContextParams& params() const { return params_; }

        GraphicsState& state() { return *state_; }
        const GraphicsState& state() const { return *state_; }

        // returns a buffer of `len` uninitialized elements
        //
        // throws `BufferError` (`CannotCreate`) if the backend cannot allocate it
        template<typename T>
        requires std::is_trivially_copyable_v<T>
        Buffer<T> new_buffer(size_t len, BufferTarget target = default_buffer_target_for<T>())
        {
            return Buffer<T>{allocate_raw_buffer(target, len, sizeof(T), nullptr)};
        }

        // returns a buffer that contains a copy of `values`
        template<std::ranges::contiguous_range Range>
        requires std::is_trivially_copyable_v<std::ranges::range_value_t<Range>>
        auto buffer_from(const Range& values, BufferTarget target = default_buffer_target_for<std::ranges::range_value_t<Range>>())
        {
            using T = std::ranges::range_value_t<Range>;
            const std::span<const T> span{values};
            return Buffer<T>{allocate_raw_buffer(target, span.size(), sizeof(T), span.empty() ? nullptr : span.data())};
        }

        // returns a buffer of `len` elements, each set to `value`
        template<typename T>
        requires std::is_trivially_copyable_v<T>
        Buffer<T> repeat_buffer(size_t len, const T& value, BufferTarget target = default_buffer_target_for<T>())
        {
            Buffer<T> rv = new_buffer<T>(len, target);
            rv.clear(value);
            return rv;
        }

        TessBuilder new_tess_builder();
        TessGate tess_gate();

        // marks all cached state as unknown
        //
        // call this after other code (e.g. a UI library) has used the backend
        // directly, so that the next bind to each target is issued
        void invalidate_state();

    private:
        RawBuffer allocate_raw_buffer(BufferTarget, size_t len, size_t element_size, const void* data);

        GraphicsContextParams params_;
        std::shared_ptr<GraphicsState> state_;
    };
}
