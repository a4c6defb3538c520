#include "config.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <numbers>
#include <random>
#include <string>
#include <variant>

using namespace relief;
using namespace relief::viewer;

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

class ScopedEnvVar {
public:
    ScopedEnvVar(const char* name, const std::string& value) : name_(name) {
        const char* original = std::getenv(name);
        if (original) {
            had_original_ = true;
            original_value_ = original;
        }
        setenv(name_.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        if (had_original_) {
            setenv(name_.c_str(), original_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    bool had_original_ = false;
    std::string original_value_;
};

class ViewerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root_ = fs::temp_directory_path() / "relief-viewer-config-tests" / std::to_string(rd());
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write_text(const fs::path& path, const std::string& text) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        ASSERT_TRUE(out.is_open());
        out << text;
    }

    fs::path root_;
};

}  // namespace

TEST_F(ViewerConfigTest, MissingFileGivesDefaults) {
    const auto cfg = load_config((root_ / "absent.json").string());
    EXPECT_FLOAT_EQ(cfg.height_scale, 1.0f);
    EXPECT_EQ(cfg.chunk_size, 256u);
    EXPECT_EQ(cfg.normal_mode, mesh::NormalMode::Smooth);
    EXPECT_TRUE(std::holds_alternative<colors::HeightGradient>(cfg.color_scheme));
    EXPECT_FLOAT_EQ(cfg.camera.fov_deg, 60.0f);
}

TEST_F(ViewerConfigTest, SaveThenLoadKeepsValues) {
    ViewerConfig cfg;
    cfg.height_scale = 2.5f;
    cfg.chunk_size = 128;
    cfg.normal_mode = mesh::NormalMode::Flat;
    cfg.color_scheme = colors::CustomGradient{{{0.0f, {0.0f, 0.0f, 1.0f}}, {1.0f, {1.0f, 0.0f, 0.0f}}}};
    cfg.cull_threshold = 10;
    cfg.chunk_threshold = 20;
    cfg.max_grid_dimension = 4096;
    cfg.worker_threads = 3;
    cfg.verbosity = 1;
    cfg.camera.fov_deg = 45.0f;
    cfg.camera.zoom_sensitivity = 0.2f;

    const auto path = root_ / "nested" / "viewer.json";
    ASSERT_TRUE(save_config(cfg, path.string()));
    ASSERT_TRUE(fs::exists(path));

    const auto loaded = load_config(path.string());
    EXPECT_FLOAT_EQ(loaded.height_scale, 2.5f);
    EXPECT_EQ(loaded.chunk_size, 128u);
    EXPECT_EQ(loaded.normal_mode, mesh::NormalMode::Flat);
    ASSERT_TRUE(std::holds_alternative<colors::CustomGradient>(loaded.color_scheme));
    const auto& stops = std::get<colors::CustomGradient>(loaded.color_scheme).stops;
    ASSERT_EQ(stops.size(), 2u);
    EXPECT_FLOAT_EQ(stops[1].t, 1.0f);
    EXPECT_FLOAT_EQ(stops[1].color[0], 1.0f);
    EXPECT_EQ(loaded.cull_threshold, 10u);
    EXPECT_EQ(loaded.chunk_threshold, 20u);
    EXPECT_EQ(loaded.max_grid_dimension, 4096u);
    EXPECT_EQ(loaded.worker_threads, 3u);
    EXPECT_EQ(loaded.verbosity, 1);
    EXPECT_FLOAT_EQ(loaded.camera.fov_deg, 45.0f);
    EXPECT_FLOAT_EQ(loaded.camera.zoom_sensitivity, 0.2f);
}

TEST_F(ViewerConfigTest, MalformedJsonFallsBackToDefaults) {
    const auto path = root_ / "broken.json";
    write_text(path, "{ \"height_scale\": 3.0, ");

    const auto cfg = load_config(path.string());
    EXPECT_FLOAT_EQ(cfg.height_scale, 1.0f);
    EXPECT_EQ(cfg.chunk_size, 256u);
}

TEST_F(ViewerConfigTest, WrongTypeFallsBackToDefaults) {
    const auto path = root_ / "typed.json";
    write_text(path, R"({"height_scale": 3.0, "chunk_size": "big"})");

    const auto cfg = load_config(path.string());
    EXPECT_FLOAT_EQ(cfg.height_scale, 1.0f);
    EXPECT_EQ(cfg.chunk_size, 256u);
}

TEST_F(ViewerConfigTest, UnknownEnumNamesKeepDefaults) {
    const auto path = root_ / "enums.json";
    write_text(path, R"({"height_scale": 3.0, "normal_mode": "bumpy", "color_scheme": "plaid", "chunk_size": 0})");

    const auto cfg = load_config(path.string());
    EXPECT_FLOAT_EQ(cfg.height_scale, 3.0f);
    EXPECT_EQ(cfg.normal_mode, mesh::NormalMode::Smooth);
    EXPECT_TRUE(std::holds_alternative<colors::HeightGradient>(cfg.color_scheme));
    EXPECT_EQ(cfg.chunk_size, 256u);
}

TEST_F(ViewerConfigTest, MonochromeTint) {
    const auto path = root_ / "mono.json";
    write_text(path, R"({"color_scheme": "monochrome", "monochrome_tint": [0.2, 0.4, 0.6]})");

    const auto cfg = load_config(path.string());
    ASSERT_TRUE(std::holds_alternative<colors::Monochrome>(cfg.color_scheme));
    EXPECT_FLOAT_EQ(std::get<colors::Monochrome>(cfg.color_scheme).tint[1], 0.4f);
}

TEST_F(ViewerConfigTest, EnvironmentOverridesPath) {
    const auto path = root_ / "from-env.json";
    ScopedEnvVar env("RELIEF_CONFIG", path.string());
    EXPECT_EQ(config_path(), path.string());

    write_text(path, R"({"camera": {"fov_deg": 30.0, "max_distance": 900.0}})");
    const auto cfg = load_config();
    EXPECT_FLOAT_EQ(cfg.camera.fov_deg, 30.0f);
    EXPECT_FLOAT_EQ(cfg.camera.max_distance, 900.0f);
    EXPECT_FLOAT_EQ(cfg.camera.min_distance, 0.5f);
}

TEST_F(ViewerConfigTest, SavedFileIsReadableJson) {
    const auto path = root_ / "plain.json";
    ASSERT_TRUE(save_config(ViewerConfig{}, path.string()));

    std::ifstream in(path);
    const json j = json::parse(in);
    EXPECT_EQ(j.at("normal_mode").get<std::string>(), "smooth");
    EXPECT_EQ(j.at("color_scheme").get<std::string>(), "terrain");
    EXPECT_TRUE(j.at("camera").contains("fov_deg"));
}

TEST(ViewerConfigMappingTest, SceneSettingsAndCamera) {
    ViewerConfig cfg;
    cfg.height_scale = 4.0f;
    cfg.chunk_size = 64;
    cfg.cull_threshold = 5;
    cfg.chunk_threshold = 6;
    cfg.max_grid_dimension = 7;
    cfg.worker_threads = 2;
    cfg.camera.fov_deg = 90.0f;
    cfg.camera.far_z = 5000.0f;
    cfg.camera.min_distance = 2.0f;
    cfg.camera.max_distance = 1.0f;

    const auto s = scene_settings(cfg);
    EXPECT_FLOAT_EQ(s.height_scale, 4.0f);
    EXPECT_EQ(s.chunk_size, 64u);
    EXPECT_EQ(s.thresholds.cull_threshold, 5u);
    EXPECT_EQ(s.thresholds.chunk_threshold, 6u);
    EXPECT_EQ(s.thresholds.max_grid_dimension, 7u);
    EXPECT_EQ(s.worker_threads, 2u);

    const auto p = perspective(cfg);
    EXPECT_NEAR(p.fov_y, std::numbers::pi_v<float> / 2.0f, 1e-6f);
    EXPECT_FLOAT_EQ(p.far_z, 5000.0f);

    const auto limits = camera_limits(cfg);
    EXPECT_FLOAT_EQ(limits.min_distance, 2.0f);
    EXPECT_FLOAT_EQ(limits.max_distance, 2.0f);
}
