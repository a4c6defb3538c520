#pragma once

#include "relief/chunks.h"
#include "relief/geom.h"

#include <cstddef>
#include <vector>

namespace relief::render_domain {

struct VisibilityStats {
    size_t tested = 0;
    size_t selected = 0;
};

// Indices, in creation order, of the chunks whose bounds are not entirely
// outside any frustum plane. Conservative: a chunk that may be visible is
// always kept. stats, when given, is overwritten.
std::vector<size_t> select_visible(const geom::Frustum& frustum,
                                   const std::vector<chunks::Chunk>& chunk_set,
                                   VisibilityStats* stats = nullptr);

} // namespace relief::render_domain
