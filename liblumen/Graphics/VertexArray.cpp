#include "VertexArray.h"

#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/TessError.h>

#include <memory>
#include <optional>
#include <utility>

using namespace lum;

lum::VertexArray::VertexArray(std::shared_ptr<GraphicsState> state) :
    state_{std::move(state)}
{
    const std::optional<VertexArrayHandle> handle = state_->backend().create_vertex_array();
    if (not handle or not *handle) {
        throw TessError{TessErrorKind::CannotCreate, "the graphics backend could not create a vertex array"};
    }
    handle_ = *handle;
}

lum::VertexArray::VertexArray(VertexArray&& tmp) noexcept :
    state_{std::move(tmp.state_)},
    handle_{std::exchange(tmp.handle_, VertexArrayHandle{})}
{}

VertexArray& lum::VertexArray::operator=(VertexArray&& tmp) noexcept
{
    if (&tmp != this) {
        destroy();
        state_ = std::move(tmp.state_);
        handle_ = std::exchange(tmp.handle_, VertexArrayHandle{});
    }
    return *this;
}

lum::VertexArray::~VertexArray() noexcept
{
    destroy();
}

void lum::VertexArray::bind() const
{
    state_->bind_vertex_array(handle_, BindMode::Cached);
}

void lum::VertexArray::destroy() noexcept
{
    if (not state_ or not handle_) {
        return;
    }

    state_->unbind_vertex_array(handle_);
    state_->backend().delete_vertex_array(handle_);

    handle_ = VertexArrayHandle{};
    state_.reset();
}
