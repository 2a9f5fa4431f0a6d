#include "BufferMapping.h"

#include <liblumen/Graphics/BufferError.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/RawBuffer.h>
#include <liblumen/Platform/Log.h>
#include <liblumen/Utils/Assertions.h>

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

using namespace lum;

lum::BufferMapping::BufferMapping(
    const RawBuffer& buffer,
    size_t byte_offset,
    size_t num_bytes,
    BufferMapAccess access) :

    state_{buffer.shared_state()},
    handle_{buffer.handle()},
    target_{buffer.target()},
    access_{access},
    num_bytes_{num_bytes}
{
    LUM_ASSERT(byte_offset + num_bytes <= buffer.bytes() && "tried to map a range that lies outside of the buffer");

    if (num_bytes_ == 0) {
        state_.reset();  // nothing to map (and nothing to unmap)
        return;
    }

    buffer.bind();
    data_ = static_cast<std::byte*>(state_->backend().map_buffer_range(target_, byte_offset, num_bytes_, access_));
    if (data_ == nullptr) {
        state_.reset();
        throw BufferError::map_failed();
    }
}

lum::BufferMapping::BufferMapping(BufferMapping&& tmp) noexcept :
    state_{std::move(tmp.state_)},
    handle_{tmp.handle_},
    target_{tmp.target_},
    access_{tmp.access_},
    num_bytes_{std::exchange(tmp.num_bytes_, 0)},
    data_{std::exchange(tmp.data_, nullptr)}
{}

lum::BufferMapping::~BufferMapping() noexcept
{
    if (not state_) {
        return;  // moved-from, or a zero-length mapping
    }

    // something else may have been bound to the target while the mapping was
    // alive, so rebind the mapped buffer before unmapping it
    bind_buffer_outside_of_vertex_array(*state_, target_, handle_, BindMode::Cached);
    if (not state_->backend().unmap_buffer(target_)) {
        std::stringstream ss;
        ss << handle_;
        log_error("%s: unmapping failed: the buffer's data store may have been corrupted while it was mapped", std::move(ss).str().c_str());
    }
}
