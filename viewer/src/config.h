#pragma once

#include "domain/camera_types.h"
#include "render_domain/terrain_scene.h"

#include "relief/colors.h"
#include "relief/mesh.h"

#include <cstdint>
#include <string>

namespace relief::viewer {

struct CameraConfig {
    float fov_deg = 60.0f;
    float near_z = 0.1f;
    float far_z = 1000.0f;
    float min_distance = 0.5f;
    float max_distance = 5000.0f;
    float rotate_sensitivity = 0.005f;
    float pan_sensitivity = 0.001f;
    float zoom_sensitivity = 0.1f;
    float preset_duration = 0.6f; // seconds
};

struct ViewerConfig {
    float height_scale = 1.0f;
    uint32_t chunk_size = 256;
    mesh::NormalMode normal_mode = mesh::NormalMode::Smooth;
    colors::ColorScheme color_scheme = colors::HeightGradient{};
    uint64_t cull_threshold = 1000ull * 1000ull;
    uint64_t chunk_threshold = 4000ull * 4000ull;
    uint32_t max_grid_dimension = 16384;
    unsigned worker_threads = 0;
    int verbosity = 0;
    CameraConfig camera;
};

// $RELIEF_CONFIG when set, else viewer.json beside the executable when it
// exists, else ~/.config/relief/viewer.json.
std::string config_path();

// Missing file -> defaults. Malformed JSON -> defaults plus a warning.
// Unknown enum names keep the default for that key.
ViewerConfig load_config();
ViewerConfig load_config(const std::string& path);

// Writes pretty JSON, creating parent directories. Returns false when the
// file cannot be opened.
bool save_config(const ViewerConfig& cfg);
bool save_config(const ViewerConfig& cfg, const std::string& path);

[[nodiscard]] render_domain::SceneSettings scene_settings(const ViewerConfig& cfg);
[[nodiscard]] CameraLimits camera_limits(const ViewerConfig& cfg);
[[nodiscard]] Perspective perspective(const ViewerConfig& cfg);

} // namespace relief::viewer
