#pragma once

#include "relief/geom.h"
#include "relief/grid.h"
#include "relief/mesh.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <thread>
#include <vector>

namespace relief::chunks {

inline constexpr uint32_t kDefaultChunkSize = 256;

// Placement of one chunk in the sample grid. The nominal extent tiles the
// grid without overlap; the sample extent adds one shared row/column toward
// the next chunk so neighbouring meshes meet on the same vertices.
struct ChunkLayout {
    uint32_t col = 0;
    uint32_t row = 0;
    uint32_t cols = 0;
    uint32_t rows = 0;
    uint32_t sample_cols = 0;
    uint32_t sample_rows = 0;

    [[nodiscard]] mesh::GridRegion sample_region() const {
        return {col, row, sample_cols, sample_rows};
    }
};

struct Chunk {
    ChunkLayout layout;
    mesh::Mesh mesh;
    geom::Aabb bounds;
};

// ceil(width/chunk_size) * ceil(height/chunk_size), or 0 for a grid that
// cannot hold a quad. Throws std::invalid_argument for chunk_size == 0.
[[nodiscard]] size_t chunk_count(uint32_t width, uint32_t height, uint32_t chunk_size);

// Row-major layouts without meshes.
[[nodiscard]] std::vector<ChunkLayout> plan_chunks(uint32_t width, uint32_t height, uint32_t chunk_size);

// Resolves 0 to the hardware concurrency (at least 1).
[[nodiscard]] unsigned resolve_worker_count(unsigned requested);

// Tiles the grid and builds every chunk mesh, spreading the work over
// worker_threads threads (0 = hardware concurrency). Output is row-major and
// independent of the thread count. A trailing chunk one sample wide keeps its
// bounds but has an empty mesh.
[[nodiscard]] std::vector<Chunk> partition(const grid::HeightGrid& grid, uint32_t chunk_size,
                                           const mesh::MeshOptions& options, unsigned worker_threads = 0);

namespace detail {

using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

// Runs job(i) for every i in [0, count) exactly once. Worker w takes slots
// w, w + workers, ...; slots of workers that could not be launched run on the
// calling thread. The first job exception is rethrown after all threads join.
void run_strided(size_t count, unsigned workers, const std::function<void(size_t)>& job,
                 const ThreadLauncher& launch);

} // namespace detail

// Union of all chunk bounds; a default box for an empty set.
[[nodiscard]] geom::Aabb combined_bounds(const std::vector<Chunk>& chunks);

} // namespace relief::chunks
