#pragma once

#include "relief/colors.h"
#include "relief/geom.h"
#include "relief/grid.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace relief::mesh {

// Packed for GPU upload: location 0 position, 1 color, 2 normal.
struct Vertex {
    std::array<float, 3> position = {0.0f, 0.0f, 0.0f};
    std::array<float, 3> color = {1.0f, 1.0f, 1.0f};
    std::array<float, 3> normal = {0.0f, 1.0f, 0.0f};
};
static_assert(sizeof(Vertex) == 9 * sizeof(float), "Vertex must stay tightly packed");

// Triangle list, counter-clockwise seen from +Y.
struct Mesh {
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;

    [[nodiscard]] bool empty() const { return indices.empty(); }
    [[nodiscard]] size_t triangle_count() const { return indices.size() / 3; }
};

enum class NormalMode {
    Flat,   // One normal per triangle; vertices are not shared.
    Smooth, // Area-weighted average of adjacent faces; one vertex per sample.
};

std::string normal_mode_name(NormalMode mode);
bool parse_normal_mode(const std::string& name, NormalMode& out);

struct MeshOptions {
    float height_scale = 1.0f;
    NormalMode normal_mode = NormalMode::Smooth;
    colors::ColorScheme color_scheme = colors::HeightGradient{};
};

// Sample-index rectangle of a grid; cols/rows are sample counts, so a region
// of N samples spans N-1 quads.
struct GridRegion {
    uint32_t col = 0;
    uint32_t row = 0;
    uint32_t cols = 0;
    uint32_t rows = 0;
};

[[nodiscard]] GridRegion whole_grid(const grid::HeightGrid& grid);

// World position of sample (col, row). The whole grid is centered on the
// origin, so a chunk's vertices land where the whole mesh would put them.
[[nodiscard]] geom::Vec3 sample_position(const grid::HeightGrid& grid, uint32_t col, uint32_t row,
                                         float height_scale);

// World-space box of a region: X/Z from its sample range, Y from the region's
// own heights times height_scale.
[[nodiscard]] geom::Aabb region_bounds(const grid::HeightGrid& grid, const GridRegion& region,
                                       float height_scale);

// Builds the mesh for a region. A region narrower than 2 samples in either
// direction yields an empty mesh. The region is clipped to the grid.
[[nodiscard]] Mesh build_mesh(const grid::HeightGrid& grid, const GridRegion& region,
                              const MeshOptions& options);
[[nodiscard]] Mesh build_mesh(const grid::HeightGrid& grid, const MeshOptions& options);

// Line-list indices over the mesh's triangle edges, each index pair once and
// in first-seen order. Used for wireframe drawing with the same vertex buffer.
// Flat meshes do not share vertices, so an edge between two faces appears
// once per face.
[[nodiscard]] std::vector<uint32_t> build_edge_indices(const Mesh& mesh);

} // namespace relief::mesh
