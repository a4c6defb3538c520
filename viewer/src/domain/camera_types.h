#pragma once

#include "relief/geom.h"

#include <numbers>
#include <variant>

// Camera types shared by the orbit controller, the terrain scene and the
// config loader. Angles are in radians, distances in world units.
namespace relief::viewer {

inline constexpr float kDefaultFovY = std::numbers::pi_v<float> / 3.0f; // 60 degrees

struct Perspective {
    float fov_y = kDefaultFovY; // Vertical field of view.
    float near_z = 0.1f;
    float far_z = 1000.0f;
};

struct Orthographic {
    float half_height = 5.0f; // Half of the visible world height.
    float near_z = 0.1f;
    float far_z = 1000.0f;
};

using Projection = std::variant<Perspective, Orthographic>;

enum class ProjectionKind {
    Perspective,
    Orthographic,
};

// Orbital camera: the eye sits on a sphere of radius `distance` around
// `target`. Azimuth 0 puts the eye on +X, azimuth pi/2 on +Z.
struct CameraState {
    float distance = 10.0f;
    float azimuth = 0.0f;   // Wrapped to [0, 2pi).
    float elevation = 0.0f; // Clamped to [-max_elevation, max_elevation].
    geom::Vec3 target = {0.0f, 0.0f, 0.0f};
    Projection projection = Perspective{};
};

// Bounds and input gains applied by every camera transition.
struct CameraLimits {
    float min_distance = 0.5f;
    float max_distance = 5000.0f;
    float max_elevation = std::numbers::pi_v<float> / 2.0f - 0.1f;
    float rotate_sensitivity = 0.005f; // Radians per pixel of drag.
    float pan_sensitivity = 0.001f;    // Fraction of the view size per pixel.
    float zoom_sensitivity = 0.1f;     // Distance fraction per scroll unit.
};

enum class CameraPreset {
    Default,   // The defaults of the loaded world.
    Isometric, // Orthographic, azimuth 45 degrees, elevation atan(1/sqrt(2)).
    Top,       // Looking straight down (elevation at the clamp).
    Front,     // Azimuth 0, level.
    Side,      // Azimuth 90 degrees, level.
};

} // namespace relief::viewer
