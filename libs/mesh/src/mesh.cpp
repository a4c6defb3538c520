#include "relief/mesh.h"

#include <algorithm>
#include <unordered_set>
#include <variant>

namespace relief::mesh {

namespace {

struct ClippedRegion {
    uint32_t col0 = 0;
    uint32_t row0 = 0;
    uint32_t col1 = 0; // exclusive
    uint32_t row1 = 0; // exclusive

    [[nodiscard]] uint32_t cols() const { return col1 - col0; }
    [[nodiscard]] uint32_t rows() const { return row1 - row0; }
};

[[nodiscard]] ClippedRegion clip(const grid::HeightGrid& grid, const GridRegion& region) {
    ClippedRegion out;
    out.col0 = std::min(region.col, grid.width());
    out.row0 = std::min(region.row, grid.height());
    out.col1 = static_cast<uint32_t>(std::min<uint64_t>(static_cast<uint64_t>(region.col) + region.cols,
                                                        grid.width()));
    out.row1 = static_cast<uint32_t>(std::min<uint64_t>(static_cast<uint64_t>(region.row) + region.rows,
                                                        grid.height()));
    out.col1 = std::max(out.col1, out.col0);
    out.row1 = std::max(out.row1, out.row0);
    return out;
}

[[nodiscard]] grid::Rgb vertex_color(const grid::HeightGrid& grid, const MeshOptions& options,
                                     uint32_t col, uint32_t row) {
    if (grid.has_colors()) return grid.color_at(col, row);
    return colors::color_for_height(options.color_scheme, grid.at(col, row), grid.bounds());
}

[[nodiscard]] geom::Vec3 face_normal(const geom::Vec3& a, const geom::Vec3& b, const geom::Vec3& c) {
    return geom::vec3_cross(geom::vec3_sub(b, a), geom::vec3_sub(c, a));
}

void accumulate(geom::Vec3& acc, const geom::Vec3& n) {
    acc[0] += n[0];
    acc[1] += n[1];
    acc[2] += n[2];
}

Mesh build_smooth(const grid::HeightGrid& grid, const ClippedRegion& r, const MeshOptions& options) {
    // Faces are accumulated over a one-sample apron around the region so edge
    // vertices see the same neighbours, in the same order, as in the whole grid.
    const uint32_t ac0 = r.col0 > 0 ? r.col0 - 1 : 0;
    const uint32_t ar0 = r.row0 > 0 ? r.row0 - 1 : 0;
    const uint32_t ac1 = std::min(r.col1 + 1, grid.width());
    const uint32_t ar1 = std::min(r.row1 + 1, grid.height());
    const uint32_t apron_w = ac1 - ac0;
    const uint32_t apron_h = ar1 - ar0;

    std::vector<geom::Vec3> positions(static_cast<size_t>(apron_w) * apron_h);
    for (uint32_t row = ar0; row < ar1; ++row) {
        for (uint32_t col = ac0; col < ac1; ++col) {
            positions[static_cast<size_t>(row - ar0) * apron_w + (col - ac0)] =
                sample_position(grid, col, row, options.height_scale);
        }
    }

    auto apron_index = [apron_w](uint32_t x, uint32_t z) {
        return static_cast<size_t>(z) * apron_w + x;
    };

    std::vector<geom::Vec3> normals(positions.size(), geom::Vec3{0.0f, 0.0f, 0.0f});
    for (uint32_t z = 0; z + 1 < apron_h; ++z) {
        for (uint32_t x = 0; x + 1 < apron_w; ++x) {
            const size_t i00 = apron_index(x, z);
            const size_t i10 = apron_index(x + 1, z);
            const size_t i01 = apron_index(x, z + 1);
            const size_t i11 = apron_index(x + 1, z + 1);

            const geom::Vec3 n0 = face_normal(positions[i00], positions[i01], positions[i10]);
            accumulate(normals[i00], n0);
            accumulate(normals[i01], n0);
            accumulate(normals[i10], n0);

            const geom::Vec3 n1 = face_normal(positions[i10], positions[i01], positions[i11]);
            accumulate(normals[i10], n1);
            accumulate(normals[i01], n1);
            accumulate(normals[i11], n1);
        }
    }

    Mesh mesh;
    const uint32_t cols = r.cols();
    const uint32_t rows = r.rows();
    mesh.vertices.reserve(static_cast<size_t>(cols) * rows);
    for (uint32_t row = r.row0; row < r.row1; ++row) {
        for (uint32_t col = r.col0; col < r.col1; ++col) {
            const size_t ai = apron_index(col - ac0, row - ar0);
            Vertex v;
            v.position = positions[ai];
            v.color = vertex_color(grid, options, col, row);
            v.normal = geom::vec3_normalize(normals[ai]);
            mesh.vertices.push_back(v);
        }
    }

    mesh.indices.reserve(static_cast<size_t>(cols - 1) * (rows - 1) * 6u);
    for (uint32_t z = 0; z + 1 < rows; ++z) {
        for (uint32_t x = 0; x + 1 < cols; ++x) {
            const uint32_t i00 = z * cols + x;
            const uint32_t i10 = i00 + 1;
            const uint32_t i01 = i00 + cols;
            const uint32_t i11 = i01 + 1;
            mesh.indices.push_back(i00); mesh.indices.push_back(i01); mesh.indices.push_back(i10);
            mesh.indices.push_back(i10); mesh.indices.push_back(i01); mesh.indices.push_back(i11);
        }
    }
    return mesh;
}

Mesh build_flat(const grid::HeightGrid& grid, const ClippedRegion& r, const MeshOptions& options) {
    Mesh mesh;
    const size_t tri_count = static_cast<size_t>(r.cols() - 1) * (r.rows() - 1) * 2u;
    mesh.vertices.reserve(tri_count * 3u);
    mesh.indices.reserve(tri_count * 3u);

    auto emit_triangle = [&](const std::array<std::array<uint32_t, 2>, 3>& corners) {
        std::array<geom::Vec3, 3> p;
        for (size_t k = 0; k < 3; ++k)
            p[k] = sample_position(grid, corners[k][0], corners[k][1], options.height_scale);
        const geom::Vec3 n = geom::vec3_normalize(face_normal(p[0], p[1], p[2]));
        for (size_t k = 0; k < 3; ++k) {
            Vertex v;
            v.position = p[k];
            v.color = vertex_color(grid, options, corners[k][0], corners[k][1]);
            v.normal = n;
            mesh.indices.push_back(static_cast<uint32_t>(mesh.vertices.size()));
            mesh.vertices.push_back(v);
        }
    };

    for (uint32_t row = r.row0; row + 1 < r.row1; ++row) {
        for (uint32_t col = r.col0; col + 1 < r.col1; ++col) {
            emit_triangle({{{col, row}, {col, row + 1}, {col + 1, row}}});
            emit_triangle({{{col + 1, row}, {col, row + 1}, {col + 1, row + 1}}});
        }
    }
    return mesh;
}

} // namespace

std::string normal_mode_name(NormalMode mode) {
    return mode == NormalMode::Flat ? "flat" : "smooth";
}

bool parse_normal_mode(const std::string& name, NormalMode& out) {
    if (name == "flat") out = NormalMode::Flat;
    else if (name == "smooth") out = NormalMode::Smooth;
    else return false;
    return true;
}

GridRegion whole_grid(const grid::HeightGrid& grid) {
    return {0, 0, grid.width(), grid.height()};
}

geom::Vec3 sample_position(const grid::HeightGrid& grid, uint32_t col, uint32_t row,
                           float height_scale) {
    const float center_x = static_cast<float>(grid.width() - 1) * 0.5f;
    const float center_z = static_cast<float>(grid.height() - 1) * 0.5f;
    return {
        static_cast<float>(col) - center_x,
        grid.at(col, row) * height_scale,
        static_cast<float>(row) - center_z,
    };
}

geom::Aabb region_bounds(const grid::HeightGrid& grid, const GridRegion& region, float height_scale) {
    const ClippedRegion r = clip(grid, region);
    if (r.cols() == 0 || r.rows() == 0) return {};

    const float center_x = static_cast<float>(grid.width() - 1) * 0.5f;
    const float center_z = static_cast<float>(grid.height() - 1) * 0.5f;
    const grid::HeightBounds hb = grid.region_bounds(r.col0, r.row0, r.cols(), r.rows());
    const float y0 = hb.min_height * height_scale;
    const float y1 = hb.max_height * height_scale;

    geom::Aabb box;
    box.min = {static_cast<float>(r.col0) - center_x, std::min(y0, y1), static_cast<float>(r.row0) - center_z};
    box.max = {static_cast<float>(r.col1 - 1) - center_x, std::max(y0, y1),
               static_cast<float>(r.row1 - 1) - center_z};
    return box;
}

Mesh build_mesh(const grid::HeightGrid& grid, const GridRegion& region, const MeshOptions& options) {
    const ClippedRegion r = clip(grid, region);
    if (r.cols() < 2 || r.rows() < 2) return {};

    // Gradient stops are ordered once here rather than per vertex.
    if (const auto* custom = std::get_if<colors::CustomGradient>(&options.color_scheme);
        custom && !grid.has_colors() &&
        !std::is_sorted(custom->stops.begin(), custom->stops.end(),
                        [](const colors::GradientStop& a, const colors::GradientStop& b) { return a.t < b.t; })) {
        MeshOptions sorted = options;
        colors::sort_stops(sorted.color_scheme);
        return build_mesh(grid, region, sorted);
    }

    if (options.normal_mode == NormalMode::Flat) return build_flat(grid, r, options);
    return build_smooth(grid, r, options);
}

Mesh build_mesh(const grid::HeightGrid& grid, const MeshOptions& options) {
    return build_mesh(grid, whole_grid(grid), options);
}

std::vector<uint32_t> build_edge_indices(const Mesh& mesh) {
    std::vector<uint32_t> out;
    std::unordered_set<uint64_t> seen;
    seen.reserve(mesh.indices.size());
    out.reserve(mesh.indices.size() * 2);

    auto add = [&](uint32_t a, uint32_t b) {
        const uint64_t key = (static_cast<uint64_t>(std::min(a, b)) << 32) | std::max(a, b);
        if (!seen.insert(key).second) return;
        out.push_back(a);
        out.push_back(b);
    };
    for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        const uint32_t a = mesh.indices[i];
        const uint32_t b = mesh.indices[i + 1];
        const uint32_t c = mesh.indices[i + 2];
        add(a, b);
        add(b, c);
        add(c, a);
    }
    return out;
}

} // namespace relief::mesh
