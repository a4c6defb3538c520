#pragma once

#include <array>
#include <cstddef>

namespace relief::geom {

using Vec3 = std::array<float, 3>;

// Column-major 4x4, m[col * 4 + row], the layout glUniformMatrix4fv expects
// with transpose = GL_FALSE.
using Mat4 = std::array<float, 16>;

[[nodiscard]] Vec3 vec3_add(const Vec3& a, const Vec3& b);
[[nodiscard]] Vec3 vec3_sub(const Vec3& a, const Vec3& b);
[[nodiscard]] Vec3 vec3_scale(const Vec3& v, float s);
[[nodiscard]] Vec3 vec3_cross(const Vec3& a, const Vec3& b);
[[nodiscard]] float vec3_dot(const Vec3& a, const Vec3& b);
[[nodiscard]] float vec3_length(const Vec3& v);
// Returns v unchanged when its length is below 1e-8.
[[nodiscard]] Vec3 vec3_normalize(const Vec3& v);

[[nodiscard]] Mat4 mat4_identity();
// out = a * b
[[nodiscard]] Mat4 mat4_multiply(const Mat4& a, const Mat4& b);
[[nodiscard]] Mat4 mat4_perspective(float fov_y_rad, float aspect, float near_z, float far_z);
[[nodiscard]] Mat4 mat4_orthographic(float half_width, float half_height, float near_z, float far_z);
// Right-handed look-at.
[[nodiscard]] Mat4 mat4_look_at(const Vec3& eye, const Vec3& center, const Vec3& up);
// Transforms a point (w = 1) and returns clip-space xyzw.
[[nodiscard]] std::array<float, 4> mat4_transform(const Mat4& m, const Vec3& p);

struct Aabb {
    Vec3 min = {0.0f, 0.0f, 0.0f};
    Vec3 max = {0.0f, 0.0f, 0.0f};

    [[nodiscard]] Vec3 center() const;
    [[nodiscard]] bool contains(const Aabb& other) const;
};

// Smallest box enclosing both.
[[nodiscard]] Aabb aabb_union(const Aabb& a, const Aabb& b);

// Plane a*x + b*y + c*z + d = 0 with (a, b, c) normalized; the inside
// half-space is where the expression is >= 0.
struct FrustumPlane {
    float a = 0.0f;
    float b = 0.0f;
    float c = 0.0f;
    float d = 0.0f;

    [[nodiscard]] float distance(const Vec3& p) const { return a * p[0] + b * p[1] + c * p[2] + d; }
};

enum class FrustumSide { Left = 0, Right, Bottom, Top, Near, Far };

struct Frustum {
    std::array<FrustumPlane, 6> planes{};

    [[nodiscard]] const FrustumPlane& plane(FrustumSide side) const {
        return planes[static_cast<size_t>(side)];
    }
};

// Gribb/Hartmann extraction from a view-projection matrix using OpenGL clip
// conventions (-w <= z <= w).
[[nodiscard]] Frustum extract_frustum(const Mat4& view_proj);

// False only when the box lies entirely in the outside half-space of some
// plane. Boxes straddling a corner may pass although they are just outside;
// a box that is at least partially inside always passes.
[[nodiscard]] bool aabb_intersects_frustum(const Frustum& frustum, const Aabb& box);

} // namespace relief::geom
