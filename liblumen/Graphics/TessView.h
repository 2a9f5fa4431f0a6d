#pragma once

#include <cstddef>

namespace lum { class Tess; }

namespace lum
{
    // a borrowed, possibly partial, view of a `Tess` that can be rendered via a `TessGate`
    //
    // must not outlive the tessellation. Views are not range-checked when they
    // are created: `TessGate::render` checks them.
    class TessView final {
    public:
        // a view of every vertex and instance of `tess`
        static TessView whole(const Tess& tess);

        // a view of every vertex of `tess`, drawn `inst_nb` times
        static TessView inst_whole(const Tess& tess, size_t inst_nb);

        // a view of the first `vert_nb` vertices of `tess`
        static TessView sub(const Tess& tess, size_t vert_nb);
        static TessView inst_sub(const Tess& tess, size_t vert_nb, size_t inst_nb);

        // a view of `vert_nb` vertices of `tess`, starting at `start_index`
        static TessView slice(const Tess& tess, size_t start_index, size_t vert_nb);
        static TessView inst_slice(const Tess& tess, size_t start_index, size_t vert_nb, size_t inst_nb);

        // implicit, so that a `Tess` can be passed wherever a whole view is expected
        TessView(const Tess& tess);

        const Tess& tess() const { return *tess_; }
        size_t start_index() const { return start_index_; }
        size_t vert_nb() const { return vert_nb_; }
        size_t inst_nb() const { return inst_nb_; }

    private:
        TessView(const Tess& tess, size_t start_index, size_t vert_nb, size_t inst_nb) :
            tess_{&tess},
            start_index_{start_index},
            vert_nb_{vert_nb},
            inst_nb_{inst_nb}
        {}

        const Tess* tess_;
        size_t start_index_;
        size_t vert_nb_;
        size_t inst_nb_;
    };
}
