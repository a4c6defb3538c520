#include "relief/chunks.h"

#include "relief/log.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

namespace relief::chunks {

namespace {

uint32_t tiles_along(uint32_t samples, uint32_t chunk_size) {
    return static_cast<uint32_t>((static_cast<uint64_t>(samples) + chunk_size - 1) / chunk_size);
}

void require_chunk_size(uint32_t chunk_size) {
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be greater than zero");
}

} // namespace

size_t chunk_count(uint32_t width, uint32_t height, uint32_t chunk_size) {
    require_chunk_size(chunk_size);
    if (width < 2 || height < 2) return 0;
    return static_cast<size_t>(tiles_along(width, chunk_size)) * tiles_along(height, chunk_size);
}

std::vector<ChunkLayout> plan_chunks(uint32_t width, uint32_t height, uint32_t chunk_size) {
    const size_t count = chunk_count(width, height, chunk_size);
    std::vector<ChunkLayout> out;
    if (count == 0) return out;
    out.reserve(count);

    for (uint64_t r = 0; r < height; r += chunk_size) {
        const auto row = static_cast<uint32_t>(r);
        const uint32_t rows = std::min(chunk_size, height - row);
        for (uint64_t c = 0; c < width; c += chunk_size) {
            const auto col = static_cast<uint32_t>(c);
            const uint32_t cols = std::min(chunk_size, width - col);
            ChunkLayout layout;
            layout.col = col;
            layout.row = row;
            layout.cols = cols;
            layout.rows = rows;
            layout.sample_cols = cols + (cols < width - col ? 1u : 0u);
            layout.sample_rows = rows + (rows < height - row ? 1u : 0u);
            out.push_back(layout);
        }
    }
    return out;
}

unsigned resolve_worker_count(unsigned requested) {
    if (requested > 0) return requested;
    const unsigned hc = std::thread::hardware_concurrency();
    return std::max(hc, 1u);
}

std::vector<Chunk> partition(const grid::HeightGrid& grid, uint32_t chunk_size,
                             const mesh::MeshOptions& options, unsigned worker_threads) {
    const std::vector<ChunkLayout> layouts = plan_chunks(grid.width(), grid.height(), chunk_size);
    std::vector<Chunk> chunks(layouts.size());
    if (layouts.empty()) return chunks;

    auto build_one = [&](size_t i) {
        Chunk& chunk = chunks[i];
        chunk.layout = layouts[i];
        const mesh::GridRegion region = layouts[i].sample_region();
        chunk.mesh = mesh::build_mesh(grid, region, options);
        chunk.bounds = mesh::region_bounds(grid, region, options.height_scale);
    };

    const unsigned workers = static_cast<unsigned>(
        std::min<size_t>(resolve_worker_count(worker_threads), layouts.size()));
    if (workers <= 1) {
        for (size_t i = 0; i < layouts.size(); ++i) build_one(i);
        return chunks;
    }

    detail::run_strided(layouts.size(), workers, build_one,
                        [](std::function<void()> fn) { return std::thread(std::move(fn)); });
    return chunks;
}

namespace detail {

void run_strided(size_t count, unsigned workers, const std::function<void(size_t)>& job,
                 const ThreadLauncher& launch) {
    std::vector<std::exception_ptr> errors(workers);
    auto run_slots = [&](unsigned w) {
        try {
            for (size_t i = w; i < count; i += workers) job(i);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    unsigned launched = 0;
    try {
        for (; launched < workers; ++launched) {
            pool.push_back(launch([&run_slots, w = launched]() { run_slots(w); }));
        }
    } catch (const std::exception& e) {
        // Typically std::system_error when the process is out of threads.
        LOGW("chunk workers: started", launched, "of", workers, "threads:", e.what());
    }
    for (unsigned w = launched; w < workers; ++w) run_slots(w);

    for (auto& t : pool) {
        if (t.joinable()) t.join();
    }
    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
}

} // namespace detail

geom::Aabb combined_bounds(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) return {};
    geom::Aabb out = chunks.front().bounds;
    for (size_t i = 1; i < chunks.size(); ++i) out = geom::aabb_union(out, chunks[i].bounds);
    return out;
}

} // namespace relief::chunks
