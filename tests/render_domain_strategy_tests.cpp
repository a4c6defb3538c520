#include "render_domain/render_strategy.h"

#include "app/orbit_camera_controller.h"

#include "relief/chunks.h"
#include "relief/grid.h"
#include "relief/mesh.h"

#include <gtest/gtest.h>

#include <memory>
#include <numbers>
#include <string>
#include <vector>

using namespace relief;
using render_domain::RenderMode;

namespace {

grid::HeightGrid flat_grid(uint32_t w, uint32_t h) {
    return grid::HeightGrid(w, h, std::vector<float>(static_cast<size_t>(w) * h, 0.0f));
}

geom::Mat4 overview_view_proj() {
    viewer::OrbitCameraController controller;
    viewer::CameraState s;
    s.distance = 200.0f;
    s.elevation = 0.85f;
    controller.set_camera_state(s);
    return controller.view_projection(1.0f);
}

geom::Mat4 looking_away_view_proj() {
    viewer::OrbitCameraController controller;
    viewer::CameraState s;
    s.target = {1000.0f, 0.0f, 0.0f};
    s.azimuth = std::numbers::pi_v<float>;
    controller.set_camera_state(s);
    return controller.view_projection(1.0f);
}

bool is_identity(const geom::Mat4& m) {
    return m == geom::mat4_identity();
}

}  // namespace

TEST(RenderStrategyTest, SmallGridsDrawWholeMesh) {
    const render_domain::StrategyThresholds t;
    EXPECT_EQ(render_domain::choose_render_mode(100, 100, t).mode, RenderMode::WholeMesh);
    EXPECT_EQ(render_domain::choose_render_mode(999, 1000, t).mode, RenderMode::WholeMesh);
    EXPECT_FALSE(render_domain::choose_render_mode(999, 1000, t).warning.has_value());
}

TEST(RenderStrategyTest, ThresholdBoundaries) {
    const render_domain::StrategyThresholds t;
    EXPECT_EQ(render_domain::choose_render_mode(1000, 1000, t).mode, RenderMode::WholeMeshCulled);
    EXPECT_EQ(render_domain::choose_render_mode(3999, 4000, t).mode, RenderMode::WholeMeshCulled);
    EXPECT_EQ(render_domain::choose_render_mode(4000, 4000, t).mode, RenderMode::Chunked);
}

TEST(RenderStrategyTest, LargeGridIsChunkedWithoutWarning) {
    const auto decision = render_domain::choose_render_mode(5000, 5000, {});
    EXPECT_EQ(decision.mode, RenderMode::Chunked);
    EXPECT_FALSE(decision.warning.has_value());
}

TEST(RenderStrategyTest, OversizedDimensionWarnsAndForcesChunked) {
    const auto decision = render_domain::choose_render_mode(16385, 2, {});
    EXPECT_EQ(decision.mode, RenderMode::Chunked);
    ASSERT_TRUE(decision.warning.has_value());
    EXPECT_EQ(decision.warning->width, 16385u);
    EXPECT_EQ(decision.warning->height, 2u);
    EXPECT_EQ(decision.warning->max_dimension, 16384u);
    EXPECT_NE(decision.warning->message.find("16385x2"), std::string::npos);

    EXPECT_FALSE(render_domain::choose_render_mode(16384, 16384, {}).warning.has_value());
}

TEST(RenderStrategyTest, OversizedWarningIsLoggedOncePerSize) {
    testing::internal::CaptureStderr();
    const auto first = render_domain::choose_render_mode(20011, 3, {});
    const auto second = render_domain::choose_render_mode(20011, 3, {});
    const std::string log = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(first.warning.has_value());
    ASSERT_TRUE(second.warning.has_value());
    EXPECT_EQ(second.warning->message, first.warning->message);

    const auto at = log.find("20011x3");
    ASSERT_NE(at, std::string::npos);
    EXPECT_EQ(log.find("20011x3", at + 1), std::string::npos);

    testing::internal::CaptureStderr();
    (void)render_domain::choose_render_mode(3, 20011, {});
    EXPECT_NE(testing::internal::GetCapturedStderr().find("3x20011"), std::string::npos);
}

TEST(RenderStrategyTest, CustomThresholds) {
    render_domain::StrategyThresholds t;
    t.cull_threshold = 10;
    t.chunk_threshold = 100;
    t.max_grid_dimension = 50;
    EXPECT_EQ(render_domain::choose_render_mode(3, 3, t).mode, RenderMode::WholeMesh);
    EXPECT_EQ(render_domain::choose_render_mode(5, 5, t).mode, RenderMode::WholeMeshCulled);
    EXPECT_EQ(render_domain::choose_render_mode(10, 10, t).mode, RenderMode::Chunked);
    EXPECT_TRUE(render_domain::choose_render_mode(51, 1, t).warning.has_value());
}

TEST(RenderStrategyTest, ModeNames) {
    EXPECT_STREQ(render_domain::render_mode_name(RenderMode::WholeMesh), "whole");
    EXPECT_STREQ(render_domain::render_mode_name(RenderMode::WholeMeshCulled), "whole-culled");
    EXPECT_STREQ(render_domain::render_mode_name(RenderMode::Chunked), "chunked");
}

TEST(RenderStrategyTest, NoSetNoItems) {
    const auto list = render_domain::emit_draw_list(nullptr, geom::mat4_identity());
    EXPECT_TRUE(list.items.empty());
    EXPECT_EQ(list.source, nullptr);
}

TEST(RenderStrategyTest, WholeMeshEmitsOneIdentityItem) {
    const auto g = flat_grid(8, 8);
    auto set = std::make_shared<render_domain::MeshSet>();
    set->mode = RenderMode::WholeMesh;
    set->whole = mesh::build_mesh(g, mesh::MeshOptions{});
    set->bounds = mesh::region_bounds(g, mesh::whole_grid(g), 1.0f);

    const auto vp = looking_away_view_proj();
    const auto list = render_domain::emit_draw_list(set, vp);
    ASSERT_EQ(list.items.size(), 1u);
    EXPECT_EQ(list.items[0].mesh, &set->whole);
    EXPECT_FALSE(list.items[0].chunk_index.has_value());
    EXPECT_TRUE(is_identity(list.items[0].model));
    EXPECT_EQ(list.items[0].view_proj, vp);
    EXPECT_EQ(list.visibility.tested, 0u);
}

TEST(RenderStrategyTest, CulledWholeMeshTestsBoundsOnce) {
    const auto g = flat_grid(8, 8);
    auto set = std::make_shared<render_domain::MeshSet>();
    set->mode = RenderMode::WholeMeshCulled;
    set->whole = mesh::build_mesh(g, mesh::MeshOptions{});
    set->bounds = mesh::region_bounds(g, mesh::whole_grid(g), 1.0f);

    const auto seen = render_domain::emit_draw_list(set, overview_view_proj());
    EXPECT_EQ(seen.items.size(), 1u);
    EXPECT_EQ(seen.visibility.tested, 1u);
    EXPECT_EQ(seen.visibility.selected, 1u);

    const auto hidden = render_domain::emit_draw_list(set, looking_away_view_proj());
    EXPECT_TRUE(hidden.items.empty());
    EXPECT_EQ(hidden.visibility.tested, 1u);
    EXPECT_EQ(hidden.visibility.selected, 0u);
}

TEST(RenderStrategyTest, ChunkedItemsPointAtVisibleChunks) {
    const auto g = flat_grid(33, 33);
    auto set = std::make_shared<render_domain::MeshSet>();
    set->mode = RenderMode::Chunked;
    set->chunks = chunks::partition(g, 8, mesh::MeshOptions{}, 1);
    set->bounds = chunks::combined_bounds(set->chunks);

    std::shared_ptr<const render_domain::MeshSet> shared = set;
    const auto list = render_domain::emit_draw_list(shared, overview_view_proj());
    set.reset();
    shared.reset();

    ASSERT_NE(list.source, nullptr);
    EXPECT_EQ(list.visibility.tested, list.source->chunks.size());
    // The trailing one-sample chunks pass the test but have nothing to draw.
    ASSERT_EQ(list.source->chunks.size(), 25u);
    EXPECT_EQ(list.visibility.selected, 25u);
    EXPECT_EQ(list.items.size(), 16u);

    for (const auto& item : list.items) {
        ASSERT_TRUE(item.chunk_index.has_value());
        EXPECT_EQ(item.mesh, &list.source->chunks[*item.chunk_index].mesh);
        EXPECT_TRUE(is_identity(item.model));
    }
}
