#pragma once

#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/BufferTarget.h>
#include <liblumen/Graphics/GraphicsBackendState.h>
#include <liblumen/Graphics/GraphicsStateStats.h>
#include <liblumen/Graphics/NativeHandle.h>
#include <liblumen/Utils/EnumHelpers.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>

namespace lum { class IGraphicsBackend; }

namespace lum
{
    // a mirror of the binding points of one (stateful) graphics backend
    //
    // every resource object that issues calls against the backend shares one
    // `GraphicsState` and routes its binds through it, so that redundant native
    // bind calls can be elided.
    //
    // invariant: a known cache entry equals the backend's real state. Any code
    // that changes the backend's bindings without going through this class breaks
    // that invariant; such code must call `invalidate()` afterwards.
    //
    // not thread-safe: the backend (and, therefore, this) is single-threaded.
    class GraphicsState final {
    public:
        // queries the initial state of the backend
        //
        // throws `StateQueryError` if the backend cannot report it
        explicit GraphicsState(std::shared_ptr<IGraphicsBackend>);
        GraphicsState(const GraphicsState&) = delete;
        GraphicsState(GraphicsState&&) noexcept = delete;
        GraphicsState& operator=(const GraphicsState&) = delete;
        GraphicsState& operator=(GraphicsState&&) noexcept = delete;
        ~GraphicsState() noexcept;

        IGraphicsBackend& backend() { return *backend_; }
        const IGraphicsBackend& backend() const { return *backend_; }
        const GraphicsBackendLimits& limits() const { return limits_; }

        // binds `handle` to `target`
        //
        // - `BindMode::Cached`: only issues the native bind if the cache doesn't
        //   already record `handle` as bound to `target`
        // - `BindMode::Forced`: always issues the native bind
        void bind_buffer(BufferTarget target, BufferHandle handle, BindMode mode);

        // if `handle` is bound to any target, binds "none" to that target, so that
        // the cache never refers to a handle that no longer exists
        void unbind_buffer(BufferHandle handle);

        // returns the cached binding for `target`, or `std::nullopt` if the
        // cache cannot vouch for the backend's current value
        std::optional<BufferHandle> bound_buffer(BufferTarget target) const
        {
            return bound_buffers_[to_index(target)];
        }

        // same protocol as `bind_buffer`
        //
        // the element-array binding is part of a vertex array's state, so changing
        // the bound vertex array marks the element-array entry as unknown
        void bind_vertex_array(VertexArrayHandle handle, BindMode mode);
        void unbind_vertex_array(VertexArrayHandle handle);
        std::optional<VertexArrayHandle> bound_vertex_array() const { return bound_vertex_array_; }

        // enables primitive restart with the given index (or disables it, if
        // `std::nullopt`), only issuing native calls if the setting changes
        void set_primitive_restart(std::optional<uint32_t> restart_index);

        // marks every entry in the cache as unknown, so that the next bind to each
        // target is issued regardless of its `BindMode`
        void invalidate();

        const GraphicsStateStats& stats() const { return stats_; }

    private:
        std::shared_ptr<IGraphicsBackend> backend_;
        GraphicsBackendLimits limits_;
        std::array<std::optional<BufferHandle>, num_options<BufferTarget>()> bound_buffers_;
        std::optional<VertexArrayHandle> bound_vertex_array_;
        std::optional<std::optional<uint32_t>> primitive_restart_index_;
        GraphicsStateStats stats_;
    };
}
