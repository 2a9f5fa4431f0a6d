#include "RawBuffer.h"

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>

#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

using namespace lum;

void lum::bind_buffer_outside_of_vertex_array(GraphicsState& state, BufferTarget target, BufferHandle handle, BindMode mode)
{
    if (target == BufferTarget::ElementArray) {
        state.bind_vertex_array(VertexArrayHandle{}, BindMode::Cached);
    }
    state.bind_buffer(target, handle, mode);
}

RawBuffer lum::RawBuffer::allocate(
    std::shared_ptr<GraphicsState> state,
    BufferTarget target,
    size_t len,
    size_t element_size,
    const void* data,
    BufferUsage usage,
    BindMode creation_bind_mode)
{
    // `bytes()` must always equal `len * element_size`
    if (element_size != 0 and len > std::numeric_limits<size_t>::max() / element_size) {
        throw BufferError::cannot_create();
    }

    const std::optional<BufferHandle> handle = state->backend().create_buffer();
    if (not handle or not *handle) {
        throw BufferError::cannot_create();
    }

    // from here on, the handle is owned by `rv`, so any exception deletes it
    RawBuffer rv{std::move(state), *handle, target, len, element_size};

    bind_buffer_outside_of_vertex_array(*rv.state_, target, rv.handle_, creation_bind_mode);
    if (not rv.state_->backend().allocate_buffer_storage(target, rv.bytes(), data, usage)) {
        throw BufferError::cannot_create();
    }

    return rv;
}

lum::RawBuffer::RawBuffer(
    std::shared_ptr<GraphicsState> state,
    BufferHandle handle,
    BufferTarget target,
    size_t len,
    size_t element_size) :

    state_{std::move(state)},
    handle_{handle},
    target_{target},
    len_{len},
    element_size_{element_size}
{}

lum::RawBuffer::RawBuffer(RawBuffer&& tmp) noexcept :
    state_{std::move(tmp.state_)},
    handle_{std::exchange(tmp.handle_, BufferHandle{})},
    target_{tmp.target_},
    len_{std::exchange(tmp.len_, 0)},
    element_size_{tmp.element_size_}
{}

RawBuffer& lum::RawBuffer::operator=(RawBuffer&& tmp) noexcept
{
    if (&tmp != this) {
        destroy();
        state_ = std::move(tmp.state_);
        handle_ = std::exchange(tmp.handle_, BufferHandle{});
        target_ = tmp.target_;
        len_ = std::exchange(tmp.len_, 0);
        element_size_ = tmp.element_size_;
    }
    return *this;
}

lum::RawBuffer::~RawBuffer() noexcept
{
    destroy();
}

void lum::RawBuffer::bind() const
{
    bind_buffer_outside_of_vertex_array(*state_, target_, handle_, BindMode::Cached);
}

void lum::RawBuffer::destroy() noexcept
{
    if (not state_ or not handle_) {
        return;  // moved-from
    }

    state_->unbind_buffer(handle_);
    state_->backend().delete_buffer(handle_);

    handle_ = BufferHandle{};
    state_.reset();
}
