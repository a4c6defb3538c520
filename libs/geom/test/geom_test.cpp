#include "relief/geom.h"

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>

using namespace relief::geom;

namespace {

bool nearly_equal(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

// Eye at +X looking at the origin, 60 degree vertical fov.
Mat4 make_view_proj() {
    const Mat4 view = mat4_look_at({10.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    const Mat4 proj = mat4_perspective(std::numbers::pi_v<float> / 3.0f, 1.0f, 0.1f, 100.0f);
    return mat4_multiply(proj, view);
}

Aabb box_around(const Vec3& c, float half) {
    return {{c[0] - half, c[1] - half, c[2] - half}, {c[0] + half, c[1] + half, c[2] + half}};
}

} // namespace

TEST(Geom, LookAtMapsTargetOntoNegativeZAxis) {
    const Mat4 view = mat4_look_at({10.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
    const auto p = mat4_transform(view, {0.0f, 0.0f, 0.0f});
    EXPECT_TRUE(nearly_equal(p[0], 0.0f));
    EXPECT_TRUE(nearly_equal(p[1], 0.0f));
    EXPECT_TRUE(nearly_equal(p[2], -10.0f));
    EXPECT_TRUE(nearly_equal(p[3], 1.0f));
}

TEST(Geom, MultiplyByIdentityIsNoop) {
    const Mat4 vp = make_view_proj();
    const Mat4 out = mat4_multiply(vp, mat4_identity());
    for (size_t i = 0; i < 16; ++i) EXPECT_FLOAT_EQ(out[i], vp[i]);
}

TEST(Geom, OrthographicMapsHalfExtentsToClipEdges) {
    const Mat4 ortho = mat4_orthographic(4.0f, 2.0f, 0.5f, 50.0f);
    const auto corner = mat4_transform(ortho, {4.0f, -2.0f, -0.5f});
    EXPECT_TRUE(nearly_equal(corner[0], 1.0f));
    EXPECT_TRUE(nearly_equal(corner[1], -1.0f));
    EXPECT_TRUE(nearly_equal(corner[2], -1.0f));
    const auto far_point = mat4_transform(ortho, {0.0f, 0.0f, -50.0f});
    EXPECT_TRUE(nearly_equal(far_point[2], 1.0f));
}

TEST(Geom, FrustumPlanesAreNormalizedAndContainTarget) {
    const Frustum f = extract_frustum(make_view_proj());
    for (const auto& p : f.planes) {
        EXPECT_TRUE(nearly_equal(std::sqrt(p.a * p.a + p.b * p.b + p.c * p.c), 1.0f));
        EXPECT_GT(p.distance({0.0f, 0.0f, 0.0f}), 0.0f);
    }
    // Near plane sits 0.1 in front of the eye, facing the target.
    EXPECT_TRUE(nearly_equal(f.plane(FrustumSide::Near).distance({9.9f, 0.0f, 0.0f}), 0.0f, 1e-3f));
}

TEST(Geom, AabbInsideFrustumIsSelected) {
    const Frustum f = extract_frustum(make_view_proj());
    EXPECT_TRUE(aabb_intersects_frustum(f, box_around({0.0f, 0.0f, 0.0f}, 1.0f)));
    // Straddling the near plane still counts.
    EXPECT_TRUE(aabb_intersects_frustum(f, box_around({10.0f, 0.0f, 0.0f}, 0.5f)));
}

TEST(Geom, AabbOutsideAnyPlaneIsRejected) {
    const Frustum f = extract_frustum(make_view_proj());
    EXPECT_FALSE(aabb_intersects_frustum(f, box_around({20.0f, 0.0f, 0.0f}, 1.0f)));   // behind eye
    EXPECT_FALSE(aabb_intersects_frustum(f, box_around({0.0f, 0.0f, 30.0f}, 1.0f)));   // far to the side
    EXPECT_FALSE(aabb_intersects_frustum(f, box_around({0.0f, 40.0f, 0.0f}, 1.0f)));   // above
    EXPECT_FALSE(aabb_intersects_frustum(f, box_around({-200.0f, 0.0f, 0.0f}, 1.0f))); // past far
}

TEST(Geom, UnionAndContainment) {
    const Aabb a{{0.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}};
    const Aabb b{{-1.0f, 0.5f, 0.0f}, {0.5f, 2.0f, 3.0f}};
    const Aabb u = aabb_union(a, b);
    EXPECT_TRUE(u.contains(a));
    EXPECT_TRUE(u.contains(b));
    EXPECT_FALSE(a.contains(u));
    const Vec3 c = a.center();
    EXPECT_FLOAT_EQ(c[0], 0.5f);
}

TEST(Geom, NormalizeLeavesZeroVectorAlone) {
    const Vec3 z = vec3_normalize({0.0f, 0.0f, 0.0f});
    EXPECT_FLOAT_EQ(z[0], 0.0f);
    const Vec3 n = vec3_normalize({3.0f, 0.0f, 4.0f});
    EXPECT_TRUE(nearly_equal(vec3_length(n), 1.0f));
    EXPECT_TRUE(nearly_equal(n[2], 0.8f));
}
