#include "render_domain/render_strategy.h"

#include "relief/log.h"

#include <string>
#include <utility>

namespace relief::render_domain {

const char* render_mode_name(RenderMode mode) {
    switch (mode) {
        case RenderMode::WholeMesh: return "whole";
        case RenderMode::WholeMeshCulled: return "whole-culled";
        case RenderMode::Chunked: return "chunked";
    }
    return "whole";
}

StrategyDecision choose_render_mode(uint32_t width, uint32_t height, const StrategyThresholds& thresholds) {
    StrategyDecision out;
    if (width > thresholds.max_grid_dimension || height > thresholds.max_grid_dimension) {
        ResourceLimitWarning w;
        w.width = width;
        w.height = height;
        w.max_dimension = thresholds.max_grid_dimension;
        w.message = "grid " + std::to_string(width) + "x" + std::to_string(height) +
                    " exceeds the maximum dimension " + std::to_string(thresholds.max_grid_dimension) +
                    ", forcing chunked rendering";
        // Every rebuild of the same grid reaches this; report each size once.
        const uint64_t key = (static_cast<uint64_t>(width) << 32) ^ height ^
                             (static_cast<uint64_t>(thresholds.max_grid_dimension) << 16);
        LOGW_ONCE(key, w.message);
        out.warning = std::move(w);
        out.mode = RenderMode::Chunked;
        return out;
    }

    const uint64_t samples = static_cast<uint64_t>(width) * height;
    if (samples < thresholds.cull_threshold) {
        out.mode = RenderMode::WholeMesh;
    } else if (samples < thresholds.chunk_threshold) {
        out.mode = RenderMode::WholeMeshCulled;
    } else {
        out.mode = RenderMode::Chunked;
    }
    return out;
}

DrawList emit_draw_list(const std::shared_ptr<const MeshSet>& set, const geom::Mat4& view_proj) {
    DrawList out;
    if (!set) return out;
    out.source = set;

    const geom::Mat4 model = geom::mat4_identity();
    auto push = [&](const mesh::Mesh& m, std::optional<size_t> chunk_index) {
        DrawItem item;
        item.mesh = &m;
        item.view_proj = view_proj;
        item.model = model;
        item.chunk_index = chunk_index;
        out.items.push_back(item);
    };

    switch (set->mode) {
        case RenderMode::WholeMesh:
            if (!set->whole.empty()) push(set->whole, std::nullopt);
            break;
        case RenderMode::WholeMeshCulled: {
            out.visibility.tested = 1;
            if (set->whole.empty()) break;
            if (geom::aabb_intersects_frustum(geom::extract_frustum(view_proj), set->bounds)) {
                out.visibility.selected = 1;
                push(set->whole, std::nullopt);
            }
            break;
        }
        case RenderMode::Chunked: {
            const auto visible = select_visible(geom::extract_frustum(view_proj), set->chunks, &out.visibility);
            out.items.reserve(visible.size());
            for (size_t index : visible) {
                if (!set->chunks[index].mesh.empty()) push(set->chunks[index].mesh, index);
            }
            break;
        }
    }
    return out;
}

} // namespace relief::render_domain
