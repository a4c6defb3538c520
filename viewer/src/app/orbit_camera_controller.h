#pragma once

#include "domain/camera_types.h"

#include "relief/geom.h"

namespace relief::viewer {

// Pure camera state transitions. Each takes the current state and returns
// the next one; the controller below only sequences them.
namespace transitions {

// Largest usable elevation limit; the eye never reaches a pole, where the
// look-at basis degenerates.
inline constexpr float kMaxElevationLimit = std::numbers::pi_v<float> / 2.0f - 1e-3f;

// Clamps max_elevation into [0, kMaxElevationLimit].
[[nodiscard]] CameraLimits sanitized(CameraLimits limits);

// Wraps azimuth into [0, 2pi) and clamps elevation and distance.
[[nodiscard]] CameraState normalized(CameraState state, const CameraLimits& limits);

[[nodiscard]] CameraState orbit(CameraState state, const CameraLimits& limits,
                                float d_azimuth, float d_elevation);
// distance *= max(1 - delta * zoom_sensitivity, 0.1), clamped. An
// orthographic half-height follows the same effective factor.
[[nodiscard]] CameraState zoom(CameraState state, const CameraLimits& limits, float delta);
// Moves the target along the view's right/up vectors; dx/dy are in pixels.
[[nodiscard]] CameraState pan(CameraState state, const CameraLimits& limits, float dx, float dy);

// Switches projection kind keeping the visible extent at the target.
// perspective_fov_y is the field of view used when switching to perspective.
[[nodiscard]] CameraState switch_projection(CameraState state, const CameraLimits& limits,
                                            ProjectionKind kind, float perspective_fov_y);

// Target state of a preset. `defaults` is what Default resets to.
[[nodiscard]] CameraState preset(CameraPreset which, const CameraState& current,
                                 const CameraState& defaults, const CameraLimits& limits);

// State at parameter t in [0, 1] between two states of the same projection
// kind; t is used as given, callers apply the easing. Azimuth takes the
// shorter way around.
[[nodiscard]] CameraState interpolate(const CameraState& from, const CameraState& to, float t);

[[nodiscard]] float wrap_angle(float radians);
// Signed delta in (-pi, pi] that turns `from` into `to`.
[[nodiscard]] float shortest_angle_delta(float from, float to);
[[nodiscard]] float ease_in_out_cubic(float t);

} // namespace transitions

[[nodiscard]] ProjectionKind projection_kind(const Projection& projection);
[[nodiscard]] geom::Vec3 eye_position(const CameraState& state);
[[nodiscard]] geom::Mat4 view_matrix(const CameraState& state);
[[nodiscard]] geom::Mat4 projection_matrix(const CameraState& state, float aspect);

class OrbitCameraController {
public:
    OrbitCameraController() = default;
    explicit OrbitCameraController(const CameraLimits& limits);

    [[nodiscard]] const CameraState& camera_state() const { return state_; }
    void set_camera_state(const CameraState& state);

    [[nodiscard]] const CameraLimits& limits() const { return limits_; }
    void set_limits(const CameraLimits& limits);

    // Frames a freshly loaded grid centered on the origin: world_extent is
    // the larger horizontal side. Widens max_distance and the far plane so the
    // whole grid stays reachable, and makes this the Default preset.
    void set_world_defaults(float world_extent, float min_height, float max_height);
    [[nodiscard]] const CameraState& defaults() const { return defaults_; }
    void reset();

    // Direct mutators; each cancels a running animation.
    void orbit(float d_azimuth, float d_elevation);
    void orbit_from_drag(double dx, double dy);
    void zoom(float delta);
    void pan(float dx, float dy);
    void set_projection(ProjectionKind kind);
    [[nodiscard]] ProjectionKind projection_kind() const;

    // Eased transition toward `target`. duration <= 0 applies it at once.
    void animate_to(const CameraState& target, float duration);
    void apply_preset(CameraPreset which, float duration);
    // Advances a running animation by dt seconds.
    void update(float dt);
    [[nodiscard]] bool animating() const { return animation_.active; }

    [[nodiscard]] geom::Vec3 eye_position() const;
    [[nodiscard]] geom::Mat4 view_matrix() const;
    [[nodiscard]] geom::Mat4 projection_matrix(float aspect) const;
    [[nodiscard]] geom::Mat4 view_projection(float aspect) const;
    [[nodiscard]] geom::Frustum frustum(float aspect) const;

private:
    struct Animation {
        CameraState from;
        CameraState to;
        float duration = 0.0f;
        float elapsed = 0.0f;
        bool active = false;
    };

    void remember_fov();

    CameraLimits limits_;
    CameraState state_;
    CameraState defaults_;
    float last_fov_y_ = kDefaultFovY;
    Animation animation_;
};

} // namespace relief::viewer
