#include "TessGate.h"

#include <liblumen/Graphics/DrawCommand.h>
#include <liblumen/Graphics/GraphicsState.h>
#include <liblumen/Graphics/IGraphicsBackend.h>
#include <liblumen/Graphics/Tess.h>
#include <liblumen/Graphics/TessError.h>
#include <liblumen/Graphics/TessView.h>
#include <liblumen/Platform/Log.h>
#include <liblumen/Utils/Assertions.h>

#include <cstddef>
#include <memory>
#include <sstream>
#include <utility>

using namespace lum;

namespace
{
    void validate_view(const TessView& view)
    {
        const Tess& tess = view.tess();
        const size_t num_vertices = tess.vertices_nb();

        if (view.start_index() > num_vertices or view.vert_nb() > num_vertices - view.start_index()) {
            std::stringstream ss;
            ss << "the view [" << view.start_index() << ", " << view.start_index() << " + " << view.vert_nb() << ") lies outside of the tessellation's " << num_vertices << " vertices";
            throw TessError{TessErrorKind::ViewOutOfRange, std::move(ss).str()};
        }

        // attributeless instancing has no data to overrun
        if (tess.num_instance_buffers() > 0 and view.inst_nb() > tess.instances_nb()) {
            std::stringstream ss;
            ss << "the view draws " << view.inst_nb() << " instances, but the tessellation only has data for " << tess.instances_nb() << " instances";
            throw TessError{TessErrorKind::ViewOutOfRange, std::move(ss).str()};
        }
    }
}

lum::TessGate::TessGate(std::shared_ptr<GraphicsState> state) :
    state_{std::move(state)}
{}

void lum::TessGate::render(const TessView& view)
{
    validate_view(view);

    const Tess& tess = view.tess();
    LUM_ASSERT(&tess.state() == state_.get() && "tried to render a tessellation that belongs to a different graphics context");

    tess.vertex_array_.bind();
    if (tess.index_type()) {
        state_->set_primitive_restart(tess.primitive_restart_index());
    }

    log_trace("drawing %zu vertices (from index %zu) and %zu instances", view.vert_nb(), view.start_index(), view.inst_nb());
    state_->backend().draw(DrawCommand{
        .mode = tess.mode(),
        .start_index = view.start_index(),
        .vert_nb = view.vert_nb(),
        .inst_nb = view.inst_nb(),
        .index_type = tess.index_type(),
    });
}
