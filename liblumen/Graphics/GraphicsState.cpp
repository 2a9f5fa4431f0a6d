#include "GraphicsState.h"

#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/StateQueryError.h>
#include <liblumen/Platform/Log.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

using namespace lum;

namespace
{
    GraphicsBackendState query_initial_state(IGraphicsBackend& backend)
    {
        std::optional<GraphicsBackendState> state = backend.query_state();
        if (not state) {
            std::stringstream ss;
            ss << backend.name() << ": the backend did not report its initial bindings/limits";
            throw StateQueryError{std::move(ss).str()};
        }
        if (state->limits.max_vertex_attributes == 0) {
            std::stringstream ss;
            ss << backend.name() << ": the backend reported that it supports zero vertex attributes";
            throw StateQueryError{std::move(ss).str()};
        }
        return *std::move(state);
    }

    std::shared_ptr<IGraphicsBackend> check_not_null(std::shared_ptr<IGraphicsBackend> backend)
    {
        if (not backend) {
            throw StateQueryError{"no graphics backend was provided"};
        }
        return backend;
    }
}

lum::GraphicsState::GraphicsState(std::shared_ptr<IGraphicsBackend> backend) :
    backend_{check_not_null(std::move(backend))}
{
    const GraphicsBackendState initial_state = query_initial_state(*backend_);

    limits_ = initial_state.limits;
    bound_buffers_[to_index(BufferTarget::Array)] = initial_state.array_buffer;
    bound_buffers_[to_index(BufferTarget::ElementArray)] = initial_state.element_array_buffer;
    bound_vertex_array_ = initial_state.vertex_array;
    primitive_restart_index_ = initial_state.primitive_restart_index;

    log_info("%s: initialized graphics state (max vertex attributes = %zu, patches = %s, arbitrary primitive restart index = %s)",
        std::string{backend_->name()}.c_str(),
        limits_.max_vertex_attributes,
        limits_.supports_patches ? "yes" : "no",
        limits_.supports_arbitrary_primitive_restart_index ? "yes" : "no"
    );
}

lum::GraphicsState::~GraphicsState() noexcept = default;

void lum::GraphicsState::bind_buffer(BufferTarget target, BufferHandle handle, BindMode mode)
{
    std::optional<BufferHandle>& entry = bound_buffers_[to_index(target)];

    if (mode == BindMode::Cached and entry == handle) {
        ++stats_.num_buffer_binds_elided;
        return;
    }

    backend_->bind_buffer(target, handle);
    entry = handle;
    ++stats_.num_buffer_binds_issued;
}

void lum::GraphicsState::unbind_buffer(BufferHandle handle)
{
    if (not handle) {
        return;  // the "none" handle can't be unbound
    }

    for (size_t i = 0; i < bound_buffers_.size(); ++i) {
        if (bound_buffers_[i] == handle) {
            const auto target = static_cast<BufferTarget>(i);
            backend_->bind_buffer(target, BufferHandle{});
            bound_buffers_[i] = BufferHandle{};
            ++stats_.num_buffer_binds_issued;
        }
    }
}

void lum::GraphicsState::bind_vertex_array(VertexArrayHandle handle, BindMode mode)
{
    if (mode == BindMode::Cached and bound_vertex_array_ == handle) {
        ++stats_.num_vertex_array_binds_elided;
        return;
    }

    backend_->bind_vertex_array(handle);
    bound_vertex_array_ = handle;
    bound_buffers_[to_index(BufferTarget::ElementArray)] = std::nullopt;
    ++stats_.num_vertex_array_binds_issued;
}

void lum::GraphicsState::unbind_vertex_array(VertexArrayHandle handle)
{
    if (handle and bound_vertex_array_ == handle) {
        backend_->bind_vertex_array(VertexArrayHandle{});
        bound_vertex_array_ = VertexArrayHandle{};
        bound_buffers_[to_index(BufferTarget::ElementArray)] = std::nullopt;
        ++stats_.num_vertex_array_binds_issued;
    }
}

void lum::GraphicsState::set_primitive_restart(std::optional<uint32_t> restart_index)
{
    if (primitive_restart_index_ and *primitive_restart_index_ == restart_index) {
        ++stats_.num_primitive_restart_changes_elided;
        return;
    }

    backend_->set_primitive_restart(restart_index);
    primitive_restart_index_ = restart_index;
    ++stats_.num_primitive_restart_changes_issued;
}

void lum::GraphicsState::invalidate()
{
    log_debug("%s: invalidating all cached graphics state", std::string{backend_->name()}.c_str());

    bound_buffers_.fill(std::nullopt);
    bound_vertex_array_ = std::nullopt;
    primitive_restart_index_ = std::nullopt;
}
