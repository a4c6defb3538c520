#include "relief/geom.h"

#include <algorithm>
#include <cmath>

namespace relief::geom {

Vec3 vec3_add(const Vec3& a, const Vec3& b) {
    return {a[0] + b[0], a[1] + b[1], a[2] + b[2]};
}

Vec3 vec3_sub(const Vec3& a, const Vec3& b) {
    return {a[0] - b[0], a[1] - b[1], a[2] - b[2]};
}

Vec3 vec3_scale(const Vec3& v, float s) {
    return {v[0] * s, v[1] * s, v[2] * s};
}

Vec3 vec3_cross(const Vec3& a, const Vec3& b) {
    return {
        a[1] * b[2] - a[2] * b[1],
        a[2] * b[0] - a[0] * b[2],
        a[0] * b[1] - a[1] * b[0],
    };
}

float vec3_dot(const Vec3& a, const Vec3& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

float vec3_length(const Vec3& v) {
    return std::sqrt(vec3_dot(v, v));
}

Vec3 vec3_normalize(const Vec3& v) {
    const float len = vec3_length(v);
    if (len > 1e-8f) return {v[0] / len, v[1] / len, v[2] / len};
    return v;
}

Mat4 mat4_identity() {
    Mat4 m{};
    m[0] = m[5] = m[10] = m[15] = 1.0f;
    return m;
}

Mat4 mat4_multiply(const Mat4& a, const Mat4& b) {
    Mat4 out{};
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k)
                sum += a[static_cast<size_t>(k * 4 + i)] * b[static_cast<size_t>(j * 4 + k)];
            out[static_cast<size_t>(j * 4 + i)] = sum;
        }
    }
    return out;
}

Mat4 mat4_perspective(float fov_y_rad, float aspect, float near_z, float far_z) {
    Mat4 m{};
    const float f = 1.0f / std::tan(fov_y_rad * 0.5f);
    m[0] = f / aspect;
    m[5] = f;
    m[10] = (far_z + near_z) / (near_z - far_z);
    m[11] = -1.0f;
    m[14] = (2.0f * far_z * near_z) / (near_z - far_z);
    return m;
}

Mat4 mat4_orthographic(float half_width, float half_height, float near_z, float far_z) {
    Mat4 m = mat4_identity();
    m[0] = 1.0f / half_width;
    m[5] = 1.0f / half_height;
    m[10] = -2.0f / (far_z - near_z);
    m[14] = -(far_z + near_z) / (far_z - near_z);
    return m;
}

Mat4 mat4_look_at(const Vec3& eye, const Vec3& center, const Vec3& up) {
    const Vec3 f = vec3_normalize(vec3_sub(center, eye));
    const Vec3 s = vec3_normalize(vec3_cross(f, up));
    const Vec3 u = vec3_cross(s, f);

    Mat4 m = mat4_identity();
    m[0] = s[0]; m[4] = s[1]; m[8] = s[2];
    m[1] = u[0]; m[5] = u[1]; m[9] = u[2];
    m[2] = -f[0]; m[6] = -f[1]; m[10] = -f[2];
    m[12] = -vec3_dot(s, eye);
    m[13] = -vec3_dot(u, eye);
    m[14] = vec3_dot(f, eye);
    return m;
}

std::array<float, 4> mat4_transform(const Mat4& m, const Vec3& p) {
    std::array<float, 4> out{};
    for (size_t row = 0; row < 4; ++row) {
        out[row] = m[row] * p[0] + m[4 + row] * p[1] + m[8 + row] * p[2] + m[12 + row];
    }
    return out;
}

Vec3 Aabb::center() const {
    return {0.5f * (min[0] + max[0]), 0.5f * (min[1] + max[1]), 0.5f * (min[2] + max[2])};
}

bool Aabb::contains(const Aabb& other) const {
    for (size_t i = 0; i < 3; ++i) {
        if (other.min[i] < min[i] || other.max[i] > max[i]) return false;
    }
    return true;
}

Aabb aabb_union(const Aabb& a, const Aabb& b) {
    Aabb out;
    for (size_t i = 0; i < 3; ++i) {
        out.min[i] = std::min(a.min[i], b.min[i]);
        out.max[i] = std::max(a.max[i], b.max[i]);
    }
    return out;
}

Frustum extract_frustum(const Mat4& m) {
    Frustum f;
    auto& planes = f.planes;
    planes[0] = {m[3] + m[0], m[7] + m[4], m[11] + m[8], m[15] + m[12]};  // left
    planes[1] = {m[3] - m[0], m[7] - m[4], m[11] - m[8], m[15] - m[12]};  // right
    planes[2] = {m[3] + m[1], m[7] + m[5], m[11] + m[9], m[15] + m[13]};  // bottom
    planes[3] = {m[3] - m[1], m[7] - m[5], m[11] - m[9], m[15] - m[13]};  // top
    planes[4] = {m[3] + m[2], m[7] + m[6], m[11] + m[10], m[15] + m[14]}; // near
    planes[5] = {m[3] - m[2], m[7] - m[6], m[11] - m[10], m[15] - m[14]}; // far

    for (auto& p : planes) {
        const float len = std::sqrt(p.a * p.a + p.b * p.b + p.c * p.c);
        if (len > 1e-8f) {
            p.a /= len;
            p.b /= len;
            p.c /= len;
            p.d /= len;
        }
    }
    return f;
}

bool aabb_intersects_frustum(const Frustum& frustum, const Aabb& box) {
    for (const auto& p : frustum.planes) {
        // Corner furthest along the plane normal.
        const float px = (p.a >= 0.0f) ? box.max[0] : box.min[0];
        const float py = (p.b >= 0.0f) ? box.max[1] : box.min[1];
        const float pz = (p.c >= 0.0f) ? box.max[2] : box.min[2];
        if (p.a * px + p.b * py + p.c * pz + p.d < 0.0f)
            return false;
    }
    return true;
}

} // namespace relief::geom
