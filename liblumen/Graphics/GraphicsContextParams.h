#pragma once

#include <liblumen/Graphics/BindMode.h>
#include <liblumen/Graphics/BufferUsage.h>

namespace lum
{
    // parameters used to configure a `GraphicsContext`
    struct GraphicsContextParams final {
        friend bool operator==(const GraphicsContextParams&, const GraphicsContextParams&) = default;

        // the usage hint given to the backend when allocating a buffer's data store
        BufferUsage default_buffer_usage = BufferUsage::Default;

        // how a newly-created buffer is bound before its data store is allocated
        //
        // `Forced` re-synchronizes the binding with the backend, in case something
        // outside of `liblumen` changed it
        BindMode creation_bind_mode = BindMode::Forced;
    };
}
