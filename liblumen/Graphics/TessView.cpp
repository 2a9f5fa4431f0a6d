#include "TessView.h"

#include <liblumen/Graphics/Tess.h>

#include <cstddef>

using namespace lum;

TessView lum::TessView::whole(const Tess& tess)
{
    return TessView{tess, 0, tess.vertices_nb(), tess.instances_nb()};
}

TessView lum::TessView::inst_whole(const Tess& tess, size_t inst_nb)
{
    return TessView{tess, 0, tess.vertices_nb(), inst_nb};
}

TessView lum::TessView::sub(const Tess& tess, size_t vert_nb)
{
    return TessView{tess, 0, vert_nb, tess.instances_nb()};
}

TessView lum::TessView::inst_sub(const Tess& tess, size_t vert_nb, size_t inst_nb)
{
    return TessView{tess, 0, vert_nb, inst_nb};
}

TessView lum::TessView::slice(const Tess& tess, size_t start_index, size_t vert_nb)
{
    return TessView{tess, start_index, vert_nb, tess.instances_nb()};
}

TessView lum::TessView::inst_slice(const Tess& tess, size_t start_index, size_t vert_nb, size_t inst_nb)
{
    return TessView{tess, start_index, vert_nb, inst_nb};
}

lum::TessView::TessView(const Tess& tess) :
    TessView{whole(tess)}
{}
