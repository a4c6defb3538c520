#pragma once

#include "app/orbit_camera_controller.h"
#include "render_domain/render_strategy.h"

#include "relief/chunks.h"
#include "relief/colors.h"
#include "relief/grid.h"
#include "relief/mesh.h"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace relief::render_domain {

struct SceneSettings {
    float height_scale = 1.0f;
    mesh::NormalMode normal_mode = mesh::NormalMode::Smooth;
    colors::ColorScheme color_scheme = colors::HeightGradient{};
    uint32_t chunk_size = chunks::kDefaultChunkSize;
    StrategyThresholds thresholds;
    unsigned worker_threads = 0; // 0 = hardware concurrency
};

struct SceneStats {
    size_t total_vertices = 0;
    size_t total_triangles = 0;
    size_t chunk_count = 0;
    size_t visible_chunks = 0;
    RenderMode mode = RenderMode::WholeMesh;
    uint64_t generation = 0;
    bool rebuild_pending = false;
    bool resource_warning = false;
};

// Builds the complete mesh set for a grid. Pure; runs on the rebuild thread.
MeshSet build_mesh_set(const grid::HeightGrid& grid, const SceneSettings& settings, uint64_t generation);

// TerrainScene owns the loaded grid and the active mesh set. Every setter is
// a single state transition that queues a rebuild on a background thread;
// the render thread calls poll_rebuild() at frame start to swap the newest
// finished set in. Sets from superseded requests are dropped.
//
// All public members must be called from the render thread.
class TerrainScene {
public:
    explicit TerrainScene(SceneSettings settings = {});
    ~TerrainScene();

    TerrainScene(const TerrainScene&) = delete;
    TerrainScene& operator=(const TerrainScene&) = delete;

    // A null grid unloads: the active set is cleared at once and nothing
    // built for the previous grid is swapped in later.
    void load(std::shared_ptr<const grid::HeightGrid> grid);
    void set_height_scale(float scale);
    void set_normal_mode(mesh::NormalMode mode);
    void set_color_scheme(const colors::ColorScheme& scheme);
    // Throws std::invalid_argument for 0.
    void set_chunk_size(uint32_t chunk_size);
    void set_thresholds(const StrategyThresholds& thresholds);

    [[nodiscard]] const SceneSettings& settings() const { return settings_; }
    [[nodiscard]] const std::shared_ptr<const grid::HeightGrid>& grid() const { return grid_; }
    [[nodiscard]] const std::shared_ptr<const MeshSet>& active() const { return active_; }

    // Builds on the calling thread and activates the result at once.
    void rebuild_now();
    // Swaps in a finished rebuild. Returns true when the active set changed.
    bool poll_rebuild();
    // Blocks until the rebuild thread is idle.
    void wait_for_rebuild();

    DrawList frame(const viewer::OrbitCameraController& camera, float aspect);
    [[nodiscard]] SceneStats stats() const;

private:
    struct RebuildJob {
        uint64_t generation = 0;
        std::shared_ptr<const grid::HeightGrid> grid;
        SceneSettings settings;
    };

    void request_rebuild();
    void worker_loop();

    SceneSettings settings_;
    std::shared_ptr<const grid::HeightGrid> grid_;
    std::shared_ptr<const MeshSet> active_;
    size_t visible_chunks_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<RebuildJob> pending_job_;
    std::shared_ptr<const MeshSet> ready_;
    uint64_t requested_generation_ = 0;
    bool worker_busy_ = false;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace relief::render_domain
