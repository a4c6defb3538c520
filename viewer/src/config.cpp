#include "config.h"

#include "relief/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <numbers>
#include <utility>
#include <variant>

namespace relief::viewer {

namespace fs = std::filesystem;
using json = nlohmann::json;

static fs::path exe_dir() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
    return fs::current_path();
}

static json rgb_to_json(const colors::Rgb& c) {
    return json::array({c[0], c[1], c[2]});
}

static colors::Rgb rgb_from_json(const json& j) {
    colors::Rgb out{};
    for (size_t i = 0; i < 3; ++i) j.at(i).get_to(out[i]);
    return out;
}

static void to_json(json& j, const CameraConfig& c) {
    j = json{
        {"fov_deg", c.fov_deg},
        {"near", c.near_z},
        {"far", c.far_z},
        {"min_distance", c.min_distance},
        {"max_distance", c.max_distance},
        {"rotate_sensitivity", c.rotate_sensitivity},
        {"pan_sensitivity", c.pan_sensitivity},
        {"zoom_sensitivity", c.zoom_sensitivity},
        {"preset_duration", c.preset_duration},
    };
}

static void from_json(const json& j, CameraConfig& c) {
    if (j.contains("fov_deg")) j.at("fov_deg").get_to(c.fov_deg);
    if (j.contains("near")) j.at("near").get_to(c.near_z);
    if (j.contains("far")) j.at("far").get_to(c.far_z);
    if (j.contains("min_distance")) j.at("min_distance").get_to(c.min_distance);
    if (j.contains("max_distance")) j.at("max_distance").get_to(c.max_distance);
    if (j.contains("rotate_sensitivity")) j.at("rotate_sensitivity").get_to(c.rotate_sensitivity);
    if (j.contains("pan_sensitivity")) j.at("pan_sensitivity").get_to(c.pan_sensitivity);
    if (j.contains("zoom_sensitivity")) j.at("zoom_sensitivity").get_to(c.zoom_sensitivity);
    if (j.contains("preset_duration")) j.at("preset_duration").get_to(c.preset_duration);
}

static void read_color_scheme(const json& j, ViewerConfig& cfg) {
    if (!j.contains("color_scheme")) return;
    const auto name = j.at("color_scheme").get<std::string>();
    colors::ColorScheme scheme;
    if (!colors::parse_scheme_name(name, scheme)) {
        LOGW("config: unknown color_scheme", name, "- keeping", colors::scheme_name(cfg.color_scheme));
        return;
    }
    if (auto* mono = std::get_if<colors::Monochrome>(&scheme); mono && j.contains("monochrome_tint")) {
        mono->tint = rgb_from_json(j.at("monochrome_tint"));
    }
    if (auto* custom = std::get_if<colors::CustomGradient>(&scheme); custom && j.contains("custom_gradient")) {
        for (const auto& stop : j.at("custom_gradient")) {
            colors::GradientStop s;
            stop.at("t").get_to(s.t);
            s.color = rgb_from_json(stop.at("color"));
            custom->stops.push_back(s);
        }
    }
    colors::sort_stops(scheme);
    cfg.color_scheme = std::move(scheme);
}

static void write_color_scheme(json& j, const ViewerConfig& cfg) {
    j["color_scheme"] = colors::scheme_name(cfg.color_scheme);
    if (const auto* mono = std::get_if<colors::Monochrome>(&cfg.color_scheme)) {
        j["monochrome_tint"] = rgb_to_json(mono->tint);
    }
    if (const auto* custom = std::get_if<colors::CustomGradient>(&cfg.color_scheme)) {
        json stops = json::array();
        for (const auto& s : custom->stops) stops.push_back(json{{"t", s.t}, {"color", rgb_to_json(s.color)}});
        j["custom_gradient"] = std::move(stops);
    }
}

std::string config_path() {
    const char* env = std::getenv("RELIEF_CONFIG");
    if (env && env[0] != '\0') return env;

    auto beside = exe_dir() / "viewer.json";
    if (fs::exists(beside)) return beside.string();

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / ".config" / "relief" / "viewer.json").string();
    }
    return beside.string();
}

ViewerConfig load_config() {
    return load_config(config_path());
}

ViewerConfig load_config(const std::string& path) {
    ViewerConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) return cfg;

    try {
        json j = json::parse(f);
        if (j.contains("height_scale")) j.at("height_scale").get_to(cfg.height_scale);
        if (j.contains("chunk_size")) {
            const auto size = j.at("chunk_size").get<uint32_t>();
            if (size > 0) cfg.chunk_size = size;
            else LOGW("config: chunk_size must be positive, keeping", cfg.chunk_size);
        }
        if (j.contains("normal_mode")) {
            const auto name = j.at("normal_mode").get<std::string>();
            if (!mesh::parse_normal_mode(name, cfg.normal_mode))
                LOGW("config: unknown normal_mode", name);
        }
        read_color_scheme(j, cfg);
        if (j.contains("cull_threshold")) j.at("cull_threshold").get_to(cfg.cull_threshold);
        if (j.contains("chunk_threshold")) j.at("chunk_threshold").get_to(cfg.chunk_threshold);
        if (j.contains("max_grid_dimension")) j.at("max_grid_dimension").get_to(cfg.max_grid_dimension);
        if (j.contains("worker_threads")) j.at("worker_threads").get_to(cfg.worker_threads);
        if (j.contains("verbosity")) {
            int level = j.at("verbosity").get<int>();
            if (level < 0) level = 0;
            if (level > 2) level = 2;
            cfg.verbosity = level;
        }
        if (j.contains("camera")) j.at("camera").get_to(cfg.camera);
    } catch (const json::exception& e) {
        LOGW("config: cannot parse", path, "-", e.what());
        cfg = ViewerConfig{};
    }
    return cfg;
}

bool save_config(const ViewerConfig& cfg) {
    return save_config(cfg, config_path());
}

bool save_config(const ViewerConfig& cfg, const std::string& path) {
    json j;
    j["height_scale"] = cfg.height_scale;
    j["chunk_size"] = cfg.chunk_size;
    j["normal_mode"] = mesh::normal_mode_name(cfg.normal_mode);
    write_color_scheme(j, cfg);
    j["cull_threshold"] = cfg.cull_threshold;
    j["chunk_threshold"] = cfg.chunk_threshold;
    j["max_grid_dimension"] = cfg.max_grid_dimension;
    j["worker_threads"] = cfg.worker_threads;
    j["verbosity"] = cfg.verbosity;
    j["camera"] = cfg.camera;

    std::error_code ec;
    const auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    std::ofstream f(path);
    if (!f.is_open()) {
        LOGW("config: cannot write", path);
        return false;
    }
    f << j.dump(2) << "\n";
    return true;
}

render_domain::SceneSettings scene_settings(const ViewerConfig& cfg) {
    render_domain::SceneSettings s;
    s.height_scale = cfg.height_scale;
    s.normal_mode = cfg.normal_mode;
    s.color_scheme = cfg.color_scheme;
    s.chunk_size = cfg.chunk_size;
    s.thresholds.cull_threshold = cfg.cull_threshold;
    s.thresholds.chunk_threshold = cfg.chunk_threshold;
    s.thresholds.max_grid_dimension = cfg.max_grid_dimension;
    s.worker_threads = cfg.worker_threads;
    return s;
}

CameraLimits camera_limits(const ViewerConfig& cfg) {
    CameraLimits l;
    l.min_distance = std::max(cfg.camera.min_distance, 1e-3f);
    l.max_distance = std::max(cfg.camera.max_distance, l.min_distance);
    l.rotate_sensitivity = cfg.camera.rotate_sensitivity;
    l.pan_sensitivity = cfg.camera.pan_sensitivity;
    l.zoom_sensitivity = cfg.camera.zoom_sensitivity;
    return l;
}

Perspective perspective(const ViewerConfig& cfg) {
    Perspective p;
    p.fov_y = std::clamp(cfg.camera.fov_deg, 1.0f, 179.0f) * std::numbers::pi_v<float> / 180.0f;
    p.near_z = cfg.camera.near_z;
    p.far_z = cfg.camera.far_z;
    return p;
}

} // namespace relief::viewer
