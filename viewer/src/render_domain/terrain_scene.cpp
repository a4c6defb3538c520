#include "render_domain/terrain_scene.h"

#include "relief/log.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace relief::render_domain {

MeshSet build_mesh_set(const grid::HeightGrid& grid, const SceneSettings& settings, uint64_t generation) {
    MeshSet set;
    set.generation = generation;
    set.grid_width = grid.width();
    set.grid_height = grid.height();

    const StrategyDecision decision = choose_render_mode(grid.width(), grid.height(), settings.thresholds);
    set.mode = decision.mode;
    set.warning = decision.warning;

    mesh::MeshOptions options;
    options.height_scale = settings.height_scale;
    options.normal_mode = settings.normal_mode;
    options.color_scheme = settings.color_scheme;

    if (set.mode == RenderMode::Chunked) {
        set.chunks = chunks::partition(grid, settings.chunk_size, options, settings.worker_threads);
        set.bounds = chunks::combined_bounds(set.chunks);
        for (const auto& c : set.chunks) {
            set.vertex_count += c.mesh.vertices.size();
            set.triangle_count += c.mesh.triangle_count();
        }
    } else {
        set.whole = mesh::build_mesh(grid, options);
        set.bounds = mesh::region_bounds(grid, mesh::whole_grid(grid), settings.height_scale);
        set.vertex_count = set.whole.vertices.size();
        set.triangle_count = set.whole.triangle_count();
    }

    LOGD("mesh set", generation, render_mode_name(set.mode), "vertices", set.vertex_count,
         "triangles", set.triangle_count, "chunks", set.chunks.size());
    return set;
}

TerrainScene::TerrainScene(SceneSettings settings) : settings_(std::move(settings)) {
    if (settings_.chunk_size == 0) throw std::invalid_argument("chunk size must be greater than zero");
    worker_ = std::thread([this]() { worker_loop(); });
}

TerrainScene::~TerrainScene() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        pending_job_.reset();
        ready_.reset();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void TerrainScene::load(std::shared_ptr<const grid::HeightGrid> grid) {
    grid_ = std::move(grid);
    if (!grid_) {
        // Unload: drop the active set and make any in-flight build stale.
        rebuild_now();
        return;
    }
    request_rebuild();
}

void TerrainScene::set_height_scale(float scale) {
    settings_.height_scale = scale;
    request_rebuild();
}

void TerrainScene::set_normal_mode(mesh::NormalMode mode) {
    settings_.normal_mode = mode;
    request_rebuild();
}

void TerrainScene::set_color_scheme(const colors::ColorScheme& scheme) {
    settings_.color_scheme = scheme;
    request_rebuild();
}

void TerrainScene::set_chunk_size(uint32_t chunk_size) {
    if (chunk_size == 0) throw std::invalid_argument("chunk size must be greater than zero");
    settings_.chunk_size = chunk_size;
    request_rebuild();
}

void TerrainScene::set_thresholds(const StrategyThresholds& thresholds) {
    settings_.thresholds = thresholds;
    request_rebuild();
}

void TerrainScene::request_rebuild() {
    if (!grid_) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RebuildJob job;
        job.generation = ++requested_generation_;
        job.grid = grid_;
        job.settings = settings_;
        // Only the newest request matters; an unstarted older one is replaced.
        pending_job_ = std::move(job);
    }
    cv_.notify_all();
}

void TerrainScene::rebuild_now() {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++requested_generation_;
        pending_job_.reset();
        ready_.reset();
    }
    if (!grid_) {
        active_.reset();
        return;
    }
    active_ = std::make_shared<const MeshSet>(build_mesh_set(*grid_, settings_, generation));
}

bool TerrainScene::poll_rebuild() {
    std::shared_ptr<const MeshSet> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready = std::move(ready_);
        ready_.reset();
    }
    if (!ready) return false;
    if (active_ && ready->generation <= active_->generation) {
        LOGD("dropping stale mesh set", ready->generation);
        return false;
    }
    active_ = std::move(ready);
    return true;
}

void TerrainScene::wait_for_rebuild() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return stop_ || (!pending_job_ && !worker_busy_); });
}

DrawList TerrainScene::frame(const viewer::OrbitCameraController& camera, float aspect) {
    DrawList list = emit_draw_list(active_, camera.view_projection(aspect));
    visible_chunks_ = active_ && active_->mode == RenderMode::Chunked ? list.visibility.selected : 0;
    return list;
}

SceneStats TerrainScene::stats() const {
    SceneStats s;
    if (active_) {
        s.total_vertices = active_->vertex_count;
        s.total_triangles = active_->triangle_count;
        s.chunk_count = active_->chunks.size();
        s.mode = active_->mode;
        s.generation = active_->generation;
        s.resource_warning = active_->warning.has_value();
    }
    s.visible_chunks = visible_chunks_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.rebuild_pending = pending_job_.has_value() || worker_busy_ || ready_ != nullptr;
    }
    return s;
}

void TerrainScene::worker_loop() {
    for (;;) {
        RebuildJob job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || pending_job_.has_value(); });
            if (stop_) return;
            job = std::move(*pending_job_);
            pending_job_.reset();
            worker_busy_ = true;
        }

        std::shared_ptr<const MeshSet> built;
        try {
            built = std::make_shared<const MeshSet>(build_mesh_set(*job.grid, job.settings, job.generation));
        } catch (const std::exception& e) {
            LOGE("terrain rebuild", job.generation, "failed:", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            worker_busy_ = false;
            if (built && !stop_ && job.generation == requested_generation_) {
                ready_ = std::move(built);
            }
        }
        cv_.notify_all();
    }
}

} // namespace relief::render_domain
