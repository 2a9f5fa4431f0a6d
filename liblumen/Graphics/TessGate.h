#pragma once

#include <memory>

namespace lum { class GraphicsState; }
namespace lum { class TessView; }

namespace lum
{
    // the draw-submission node of the render pipeline: renders tessellations
    class TessGate final {
    public:
        explicit TessGate(std::shared_ptr<GraphicsState>);

        // binds the view's tessellation and issues exactly one draw submission for it
        //
        // throws `TessError` (`ViewOutOfRange`), without drawing anything, if the
        // view addresses vertices (or instances) that the tessellation doesn't have
        void render(const TessView&);

    private:
        std::shared_ptr<GraphicsState> state_;
    };
}
