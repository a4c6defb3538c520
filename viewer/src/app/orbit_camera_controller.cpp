#include "orbit_camera_controller.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace relief::viewer {

namespace {

constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
constexpr float kMinHalfHeight = 1e-3f;

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

} // namespace

namespace transitions {

float wrap_angle(float radians) {
    float r = std::fmod(radians, kTwoPi);
    if (r < 0.0f) r += kTwoPi;
    if (r >= kTwoPi) r = 0.0f;
    return r;
}

float shortest_angle_delta(float from, float to) {
    float d = std::fmod(to - from, kTwoPi);
    if (d > std::numbers::pi_v<float>) d -= kTwoPi;
    if (d <= -std::numbers::pi_v<float>) d += kTwoPi;
    return d;
}

float ease_in_out_cubic(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    if (t < 0.5f) return 4.0f * t * t * t;
    const float u = -2.0f * t + 2.0f;
    return 1.0f - u * u * u * 0.5f;
}

CameraLimits sanitized(CameraLimits limits) {
    limits.max_elevation = std::clamp(limits.max_elevation, 0.0f, kMaxElevationLimit);
    return limits;
}

CameraState normalized(CameraState state, const CameraLimits& limits) {
    const float max_elevation = std::clamp(limits.max_elevation, 0.0f, kMaxElevationLimit);
    state.azimuth = wrap_angle(state.azimuth);
    state.elevation = std::clamp(state.elevation, -max_elevation, max_elevation);
    state.distance = std::clamp(state.distance, limits.min_distance, limits.max_distance);
    if (auto* ortho = std::get_if<Orthographic>(&state.projection)) {
        ortho->half_height = std::max(ortho->half_height, kMinHalfHeight);
    }
    return state;
}

CameraState orbit(CameraState state, const CameraLimits& limits, float d_azimuth, float d_elevation) {
    state.azimuth += d_azimuth;
    state.elevation += d_elevation;
    return normalized(state, limits);
}

CameraState zoom(CameraState state, const CameraLimits& limits, float delta) {
    const float factor = std::max(1.0f - delta * limits.zoom_sensitivity, 0.1f);
    const float before = state.distance;
    state.distance = std::clamp(before * factor, limits.min_distance, limits.max_distance);
    if (auto* ortho = std::get_if<Orthographic>(&state.projection)) {
        const float effective = before > 0.0f ? state.distance / before : 1.0f;
        ortho->half_height = std::max(ortho->half_height * effective, kMinHalfHeight);
    }
    return state;
}

CameraState pan(CameraState state, const CameraLimits& limits, float dx, float dy) {
    const geom::Vec3 eye = eye_position(state);
    const geom::Vec3 forward = geom::vec3_normalize(geom::vec3_sub(state.target, eye));
    const geom::Vec3 right = geom::vec3_normalize(geom::vec3_cross(forward, {0.0f, 1.0f, 0.0f}));
    const geom::Vec3 up = geom::vec3_cross(right, forward);

    float view_size = state.distance;
    if (const auto* ortho = std::get_if<Orthographic>(&state.projection)) view_size = ortho->half_height;
    const float scale = view_size * limits.pan_sensitivity;

    state.target = geom::vec3_sub(state.target, geom::vec3_scale(right, dx * scale));
    state.target = geom::vec3_add(state.target, geom::vec3_scale(up, dy * scale));
    return state;
}

CameraState switch_projection(CameraState state, const CameraLimits& limits,
                              ProjectionKind kind, float perspective_fov_y) {
    if (projection_kind(state.projection) == kind) return state;

    if (kind == ProjectionKind::Orthographic) {
        const auto& p = std::get<Perspective>(state.projection);
        Orthographic o;
        o.half_height = std::max(state.distance * std::tan(p.fov_y * 0.5f), kMinHalfHeight);
        o.near_z = p.near_z;
        o.far_z = p.far_z;
        state.projection = o;
        return state;
    }

    const auto& o = std::get<Orthographic>(state.projection);
    Perspective p;
    p.fov_y = perspective_fov_y;
    p.near_z = o.near_z;
    p.far_z = o.far_z;
    state.distance = std::clamp(o.half_height / std::tan(p.fov_y * 0.5f),
                                limits.min_distance, limits.max_distance);
    state.projection = p;
    return state;
}

CameraState preset(CameraPreset which, const CameraState& current, const CameraState& defaults,
                   const CameraLimits& limits) {
    CameraState s = current;
    switch (which) {
        case CameraPreset::Default:
            return normalized(defaults, limits);
        case CameraPreset::Isometric:
            s.azimuth = std::numbers::pi_v<float> / 4.0f;
            s.elevation = std::atan(1.0f / std::numbers::sqrt2_v<float>);
            s = switch_projection(s, limits, ProjectionKind::Orthographic, kDefaultFovY);
            break;
        case CameraPreset::Top:
            s.elevation = limits.max_elevation;
            break;
        case CameraPreset::Front:
            s.azimuth = 0.0f;
            s.elevation = 0.0f;
            break;
        case CameraPreset::Side:
            s.azimuth = std::numbers::pi_v<float> / 2.0f;
            s.elevation = 0.0f;
            break;
    }
    return normalized(s, limits);
}

CameraState interpolate(const CameraState& from, const CameraState& to, float t) {
    if (t <= 0.0f) return from;
    if (t >= 1.0f) return to;

    CameraState out = to;
    out.azimuth = wrap_angle(from.azimuth + shortest_angle_delta(from.azimuth, to.azimuth) * t);
    out.elevation = lerp(from.elevation, to.elevation, t);
    out.distance = lerp(from.distance, to.distance, t);
    for (size_t i = 0; i < 3; ++i) out.target[i] = lerp(from.target[i], to.target[i], t);

    const auto* pa = std::get_if<Perspective>(&from.projection);
    const auto* pb = std::get_if<Perspective>(&to.projection);
    const auto* oa = std::get_if<Orthographic>(&from.projection);
    const auto* ob = std::get_if<Orthographic>(&to.projection);
    if (pa && pb) {
        out.projection = Perspective{lerp(pa->fov_y, pb->fov_y, t), lerp(pa->near_z, pb->near_z, t),
                                     lerp(pa->far_z, pb->far_z, t)};
    } else if (oa && ob) {
        out.projection = Orthographic{lerp(oa->half_height, ob->half_height, t),
                                      lerp(oa->near_z, ob->near_z, t), lerp(oa->far_z, ob->far_z, t)};
    } else {
        out.projection = from.projection;
    }
    return out;
}

} // namespace transitions

ProjectionKind projection_kind(const Projection& projection) {
    return std::holds_alternative<Orthographic>(projection) ? ProjectionKind::Orthographic
                                                            : ProjectionKind::Perspective;
}

geom::Vec3 eye_position(const CameraState& state) {
    const float ce = std::cos(state.elevation);
    const float se = std::sin(state.elevation);
    const float ca = std::cos(state.azimuth);
    const float sa = std::sin(state.azimuth);
    return {
        state.target[0] + state.distance * ce * ca,
        state.target[1] + state.distance * se,
        state.target[2] + state.distance * ce * sa,
    };
}

geom::Mat4 view_matrix(const CameraState& state) {
    return geom::mat4_look_at(eye_position(state), state.target, {0.0f, 1.0f, 0.0f});
}

geom::Mat4 projection_matrix(const CameraState& state, float aspect) {
    if (!(aspect > 0.0f)) aspect = 1.0f;
    if (const auto* o = std::get_if<Orthographic>(&state.projection)) {
        return geom::mat4_orthographic(o->half_height * aspect, o->half_height, o->near_z, o->far_z);
    }
    const auto& p = std::get<Perspective>(state.projection);
    return geom::mat4_perspective(p.fov_y, aspect, p.near_z, p.far_z);
}

OrbitCameraController::OrbitCameraController(const CameraLimits& limits)
    : limits_(transitions::sanitized(limits)), state_(transitions::normalized(CameraState{}, limits_)),
      defaults_(state_) {}

void OrbitCameraController::set_camera_state(const CameraState& state) {
    animation_.active = false;
    state_ = transitions::normalized(state, limits_);
    remember_fov();
}

void OrbitCameraController::set_limits(const CameraLimits& limits) {
    limits_ = transitions::sanitized(limits);
    state_ = transitions::normalized(state_, limits_);
    defaults_ = transitions::normalized(defaults_, limits_);
}

void OrbitCameraController::set_world_defaults(float world_extent, float min_height, float max_height) {
    const float extent = std::max(world_extent, 1.0f);
    const float relief = std::max(max_height - min_height, 0.0f);
    limits_.max_distance = std::max(limits_.max_distance, extent * 4.0f);

    CameraState d;
    d.target = {0.0f, (min_height + max_height) * 0.5f, 0.0f};
    d.distance = std::clamp(extent * 1.2f, limits_.min_distance, limits_.max_distance);
    d.azimuth = 0.65f;
    d.elevation = 0.85f;

    const float far_z = std::max(1000.0f, d.distance + extent * 2.0f + relief);
    if (viewer::projection_kind(state_.projection) == ProjectionKind::Orthographic) {
        Orthographic o = std::get<Orthographic>(state_.projection);
        o.half_height = d.distance * std::tan(last_fov_y_ * 0.5f);
        o.far_z = far_z;
        d.projection = o;
    } else {
        Perspective p = std::get<Perspective>(state_.projection);
        p.far_z = far_z;
        d.projection = p;
    }

    defaults_ = transitions::normalized(d, limits_);
    animation_.active = false;
    state_ = defaults_;
    remember_fov();
}

void OrbitCameraController::reset() {
    animation_.active = false;
    state_ = defaults_;
    remember_fov();
}

void OrbitCameraController::orbit(float d_azimuth, float d_elevation) {
    animation_.active = false;
    state_ = transitions::orbit(state_, limits_, d_azimuth, d_elevation);
}

void OrbitCameraController::orbit_from_drag(double dx, double dy) {
    // Dragging right turns the scene right; dragging down lifts the eye.
    orbit(-static_cast<float>(dx) * limits_.rotate_sensitivity,
          static_cast<float>(dy) * limits_.rotate_sensitivity);
}

void OrbitCameraController::zoom(float delta) {
    animation_.active = false;
    state_ = transitions::zoom(state_, limits_, delta);
}

void OrbitCameraController::pan(float dx, float dy) {
    animation_.active = false;
    state_ = transitions::pan(state_, limits_, dx, dy);
}

void OrbitCameraController::set_projection(ProjectionKind kind) {
    animation_.active = false;
    remember_fov();
    state_ = transitions::switch_projection(state_, limits_, kind, last_fov_y_);
}

ProjectionKind OrbitCameraController::projection_kind() const {
    return viewer::projection_kind(state_.projection);
}

void OrbitCameraController::animate_to(const CameraState& target, float duration) {
    animation_.active = false;
    remember_fov();
    const CameraState goal = transitions::normalized(target, limits_);

    const ProjectionKind goal_kind = viewer::projection_kind(goal.projection);
    if (goal_kind != projection_kind()) {
        float fov = last_fov_y_;
        if (const auto* p = std::get_if<Perspective>(&goal.projection)) fov = p->fov_y;
        state_ = transitions::switch_projection(state_, limits_, goal_kind, fov);
    }

    if (!(duration > 0.0f)) {
        state_ = goal;
        remember_fov();
        return;
    }

    animation_.from = state_;
    animation_.to = goal;
    animation_.duration = duration;
    animation_.elapsed = 0.0f;
    animation_.active = true;
}

void OrbitCameraController::apply_preset(CameraPreset which, float duration) {
    animate_to(transitions::preset(which, state_, defaults_, limits_), duration);
}

void OrbitCameraController::update(float dt) {
    if (!animation_.active) return;
    animation_.elapsed += std::max(dt, 0.0f);
    if (animation_.elapsed >= animation_.duration) {
        state_ = animation_.to;
        animation_.active = false;
        remember_fov();
        return;
    }
    const float t = transitions::ease_in_out_cubic(animation_.elapsed / animation_.duration);
    state_ = transitions::interpolate(animation_.from, animation_.to, t);
}

geom::Vec3 OrbitCameraController::eye_position() const {
    return viewer::eye_position(state_);
}

geom::Mat4 OrbitCameraController::view_matrix() const {
    return viewer::view_matrix(state_);
}

geom::Mat4 OrbitCameraController::projection_matrix(float aspect) const {
    return viewer::projection_matrix(state_, aspect);
}

geom::Mat4 OrbitCameraController::view_projection(float aspect) const {
    return geom::mat4_multiply(projection_matrix(aspect), view_matrix());
}

geom::Frustum OrbitCameraController::frustum(float aspect) const {
    return geom::extract_frustum(view_projection(aspect));
}

void OrbitCameraController::remember_fov() {
    if (const auto* p = std::get_if<Perspective>(&state_.projection)) last_fov_y_ = p->fov_y;
}

} // namespace relief::viewer
