#include "GraphicsContext.h"

#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>

#include <cstddef>
#include <memory>
#include <utility>

using namespace lum;

lum::GraphicsContext::GraphicsContext(
    std::shared_ptr<IGraphicsBackend> backend,
    const GraphicsContextParams& params) :

    params_{params},
    state_{std::make_shared<GraphicsState>(std::move(backend))}
{}

TessBuilder lum::GraphicsContext::new_tess_builder()
{
    return TessBuilder{state_, params_};
}

TessGate lum::GraphicsContext::tess_gate()
{
    return TessGate{state_};
}

void lum::GraphicsContext::invalidate_state()
{
    state_->invalidate();
}

RawBuffer lum::GraphicsContext::allocate_raw_buffer(
    BufferTarget target,
    size_t len,
    size_t element_size,
    const void* data)
{
    return RawBuffer::allocate(
        state_,
        target,
        len,
        element_size,
        data,
        params_.default_buffer_usage,
        params_.creation_bind_mode
    );
}
