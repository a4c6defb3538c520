#include "render_domain/visibility_selector.h"

namespace relief::render_domain {

std::vector<size_t> select_visible(const geom::Frustum& frustum,
                                   const std::vector<chunks::Chunk>& chunk_set,
                                   VisibilityStats* stats) {
    std::vector<size_t> out;
    out.reserve(chunk_set.size());
    for (size_t i = 0; i < chunk_set.size(); ++i) {
        if (geom::aabb_intersects_frustum(frustum, chunk_set[i].bounds)) out.push_back(i);
    }
    if (stats) {
        stats->tested = chunk_set.size();
        stats->selected = out.size();
    }
    return out;
}

} // namespace relief::render_domain
