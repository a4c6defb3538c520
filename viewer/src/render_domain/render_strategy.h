#pragma once

#include "render_domain/visibility_selector.h"

#include "relief/chunks.h"
#include "relief/geom.h"
#include "relief/mesh.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relief::render_domain {

enum class RenderMode {
    WholeMesh,       // One mesh, always drawn.
    WholeMeshCulled, // One mesh behind a single bounds test.
    Chunked,         // Per-chunk frustum culling.
};

const char* render_mode_name(RenderMode mode);

// Sample-count thresholds: width*height below cull_threshold draws the whole
// mesh, below chunk_threshold culls it as one box, anything else is chunked.
struct StrategyThresholds {
    uint64_t cull_threshold = 1000ull * 1000ull;
    uint64_t chunk_threshold = 4000ull * 4000ull;
    uint32_t max_grid_dimension = 16384;
};

// Advisory only: the grid is still rendered, in chunked mode.
struct ResourceLimitWarning {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t max_dimension = 0;
    std::string message;
};

struct StrategyDecision {
    RenderMode mode = RenderMode::WholeMesh;
    std::optional<ResourceLimitWarning> warning;
};

// Picks the mode for a grid of the given size and logs the warning, if any.
StrategyDecision choose_render_mode(uint32_t width, uint32_t height, const StrategyThresholds& thresholds);

// Everything the render thread draws from, built off-thread and swapped in
// whole. In the whole-mesh modes only `whole` is filled, in chunked mode only
// `chunks`.
struct MeshSet {
    uint64_t generation = 0;
    RenderMode mode = RenderMode::WholeMesh;
    uint32_t grid_width = 0;
    uint32_t grid_height = 0;
    mesh::Mesh whole;
    std::vector<chunks::Chunk> chunks;
    geom::Aabb bounds;
    size_t vertex_count = 0;
    size_t triangle_count = 0;
    std::optional<ResourceLimitWarning> warning;
};

// One draw call for the shading stage. Vertex positions are already centered,
// so model is the identity.
struct DrawItem {
    const mesh::Mesh* mesh = nullptr;
    geom::Mat4 view_proj{};
    geom::Mat4 model{};
    std::optional<size_t> chunk_index; // Empty for the whole mesh.
};

// Draw items plus the set they point into, kept alive for as long as the
// list is.
struct DrawList {
    std::shared_ptr<const MeshSet> source;
    std::vector<DrawItem> items;
    VisibilityStats visibility;
};

DrawList emit_draw_list(const std::shared_ptr<const MeshSet>& set, const geom::Mat4& view_proj);

} // namespace relief::render_domain
