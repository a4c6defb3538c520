#include "app/orbit_camera_controller.h"
#include "config.h"
#include "render_domain/terrain_scene.h"

#include "relief/fdf.h"
#include "relief/heightgen.h"
#include "relief/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;
using namespace relief;

struct Cli {
    std::string input_path;
    std::string config_path;
    uint32_t gen_width = 0;
    uint32_t gen_height = 0;
    uint64_t seed = 1;
    bool have_scale = false;
    float scale = 1.0f;
    std::string normals;
    std::string colors;
    uint32_t chunk_size = 0;
    int threads = -1;
    int frames = 120;
    float aspect = 16.0f / 9.0f;
    std::string preset;
    std::string projection;
    bool json_stdout = false;
    int verbosity = 0;
};

struct FrameSummary {
    size_t frames = 0;
    size_t min_items = std::numeric_limits<size_t>::max();
    size_t max_items = 0;
    size_t total_items = 0;
};

static void print_usage() {
    std::cerr << "Usage: relief_info [flags] <input.fdf>\n"
              << "       relief_info [flags] --generate WxH [--seed N]\n\n"
              << "Builds the terrain mesh set for a heightmap, drives the orbit camera\n"
              << "over a number of simulated frames and prints scene statistics.\n\n"
              << "Flags:\n"
              << "  --config <path>       Viewer config (default: $RELIEF_CONFIG or viewer.json)\n"
              << "  --generate WxH        Use a generated grid instead of a file\n"
              << "  --seed <n>            Generator seed (default: 1)\n"
              << "  --scale <f>           Height scale\n"
              << "  --normals flat|smooth Normal mode\n"
              << "  --colors <name>       terrain, heatmap, monochrome or custom\n"
              << "  --chunk-size <n>      Samples per chunk side\n"
              << "  --threads <n>         Mesh worker threads (0 = all cores)\n"
              << "  --frames <n>          Simulated frames (default: 120)\n"
              << "  --aspect <f>          Viewport aspect ratio (default: 1.778)\n"
              << "  --preset <name>       default, isometric, top, front or side\n"
              << "  --projection persp|ortho\n"
              << "  --json                Write statistics as JSON to stdout\n"
              << "  -v, --verbose         Enable verbose logging\n"
              << "  -vv, --debug          Enable debug logging\n";
}

static bool parse_size(const std::string& s, uint32_t& w, uint32_t& h) {
    const auto x = s.find_first_of("xX");
    if (x == std::string::npos) return false;
    const unsigned long pw = std::stoul(s.substr(0, x));
    const unsigned long ph = std::stoul(s.substr(x + 1));
    if (pw > std::numeric_limits<uint32_t>::max() || ph > std::numeric_limits<uint32_t>::max()) return false;
    w = static_cast<uint32_t>(pw);
    h = static_cast<uint32_t>(ph);
    return true;
}

static bool parse_preset(const std::string& s, viewer::CameraPreset& out) {
    if (s == "default") out = viewer::CameraPreset::Default;
    else if (s == "isometric") out = viewer::CameraPreset::Isometric;
    else if (s == "top") out = viewer::CameraPreset::Top;
    else if (s == "front") out = viewer::CameraPreset::Front;
    else if (s == "side") out = viewer::CameraPreset::Side;
    else return false;
    return true;
}

static int parse_cli(int argc, char** argv, Cli& cli) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) cli.config_path = argv[++i];
        else if (std::strcmp(argv[i], "--generate") == 0 && i + 1 < argc) {
            if (!parse_size(argv[++i], cli.gen_width, cli.gen_height)) {
                std::cerr << "Error: --generate expects WxH\n";
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) cli.seed = std::stoull(argv[++i]);
        else if (std::strcmp(argv[i], "--scale") == 0 && i + 1 < argc) {
            cli.scale = std::stof(argv[++i]);
            cli.have_scale = true;
        }
        else if (std::strcmp(argv[i], "--normals") == 0 && i + 1 < argc) cli.normals = argv[++i];
        else if (std::strcmp(argv[i], "--colors") == 0 && i + 1 < argc) cli.colors = argv[++i];
        else if (std::strcmp(argv[i], "--chunk-size") == 0 && i + 1 < argc)
            cli.chunk_size = static_cast<uint32_t>(std::stoul(argv[++i]));
        else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) cli.threads = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) cli.frames = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--aspect") == 0 && i + 1 < argc) cli.aspect = std::stof(argv[++i]);
        else if (std::strcmp(argv[i], "--preset") == 0 && i + 1 < argc) cli.preset = argv[++i];
        else if (std::strcmp(argv[i], "--projection") == 0 && i + 1 < argc) cli.projection = argv[++i];
        else if (std::strcmp(argv[i], "--json") == 0) cli.json_stdout = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            cli.verbosity = std::min(cli.verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0)
            cli.verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 2;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Error: unknown flag " << argv[i] << '\n';
            return 1;
        } else {
            cli.input_path = argv[i];
        }
    }
    if (cli.input_path.empty() && cli.gen_width == 0) {
        print_usage();
        return 1;
    }
    return 0;
}

static void apply_overrides(const Cli& cli, viewer::ViewerConfig& cfg) {
    if (cli.have_scale) cfg.height_scale = cli.scale;
    if (!cli.normals.empty() && !mesh::parse_normal_mode(cli.normals, cfg.normal_mode))
        throw std::invalid_argument("unknown normal mode: " + cli.normals);
    if (!cli.colors.empty() && !colors::parse_scheme_name(cli.colors, cfg.color_scheme))
        throw std::invalid_argument("unknown color scheme: " + cli.colors);
    if (cli.chunk_size > 0) cfg.chunk_size = cli.chunk_size;
    if (cli.threads >= 0) cfg.worker_threads = static_cast<unsigned>(cli.threads);
}

static std::shared_ptr<const grid::HeightGrid> acquire_grid(const Cli& cli) {
    if (cli.gen_width > 0) {
        heightgen::GenOptions opts;
        opts.width = cli.gen_width;
        opts.height = cli.gen_height;
        opts.seed = cli.seed;
        LOGI("Generating", cli.gen_width, "x", cli.gen_height, "seed", cli.seed);
        return std::make_shared<const grid::HeightGrid>(heightgen::generate(opts));
    }
    LOGI("Reading", cli.input_path);
    return std::make_shared<const grid::HeightGrid>(fdf::load(cli.input_path));
}

static FrameSummary simulate(render_domain::TerrainScene& scene, viewer::OrbitCameraController& camera,
                             int frames, float aspect) {
    FrameSummary summary;
    constexpr float dt = 1.0f / 60.0f;
    for (int i = 0; i < frames; ++i) {
        camera.update(dt);
        // Slow turntable once any preset transition has finished.
        if (!camera.animating()) camera.orbit_from_drag(-2.0, 0.0);
        scene.poll_rebuild();

        const auto list = scene.frame(camera, aspect);
        summary.frames++;
        summary.total_items += list.items.size();
        summary.min_items = std::min(summary.min_items, list.items.size());
        summary.max_items = std::max(summary.max_items, list.items.size());
        LOGD_RATE_LIMIT(250, "frame", i, "items", list.items.size(), "visible", list.visibility.selected);
    }
    if (summary.frames == 0) summary.min_items = 0;
    return summary;
}

static json stats_json(const grid::HeightGrid& g, const render_domain::SceneStats& stats,
                       const FrameSummary& frames, double build_ms, const viewer::OrbitCameraController& camera) {
    const auto& s = camera.camera_state();
    json doc = {
        {"grid", {{"width", g.width()}, {"height", g.height()},
                  {"minHeight", g.bounds().min_height}, {"maxHeight", g.bounds().max_height}}},
        {"mode", render_domain::render_mode_name(stats.mode)},
        {"vertices", stats.total_vertices},
        {"triangles", stats.total_triangles},
        {"chunks", stats.chunk_count},
        {"generation", stats.generation},
        {"resourceWarning", stats.resource_warning},
        {"buildMs", build_ms},
        {"frames", {{"count", frames.frames}, {"minItems", frames.min_items}, {"maxItems", frames.max_items},
                    {"lastVisibleChunks", stats.visible_chunks}}},
        {"camera", {{"distance", s.distance}, {"azimuth", s.azimuth}, {"elevation", s.elevation},
                    {"projection", camera.projection_kind() == viewer::ProjectionKind::Orthographic
                                       ? "orthographic" : "perspective"}}},
    };
    return doc;
}

int main(int argc, char* argv[]) {
    Cli cli;
    try {
        if (int rc = parse_cli(argc, argv, cli); rc != 0) return rc == 2 ? 0 : rc;

        viewer::ViewerConfig cfg = cli.config_path.empty() ? viewer::load_config()
                                                           : viewer::load_config(cli.config_path);
        log::set_verbosity(std::max(cfg.verbosity, cli.verbosity));
        apply_overrides(cli, cfg);

        const auto g = acquire_grid(cli);
        if (g->degenerate()) LOGW("grid", g->width(), "x", g->height(), "has no quads, nothing to draw");

        render_domain::TerrainScene scene(viewer::scene_settings(cfg));
        const auto start = std::chrono::steady_clock::now();
        scene.load(g);
        scene.wait_for_rebuild();
        scene.poll_rebuild();
        const double build_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

        viewer::OrbitCameraController camera(viewer::camera_limits(cfg));
        viewer::CameraState initial = camera.camera_state();
        initial.projection = viewer::perspective(cfg);
        camera.set_camera_state(initial);

        float min_y = 0.0f;
        float max_y = 0.0f;
        if (const auto& set = scene.active()) {
            min_y = set->bounds.min[1];
            max_y = set->bounds.max[1];
        }
        const float extent = static_cast<float>(std::max(g->width(), g->height())) - 1.0f;
        camera.set_world_defaults(extent, min_y, max_y);

        if (cli.projection == "ortho") camera.set_projection(viewer::ProjectionKind::Orthographic);
        else if (!cli.projection.empty() && cli.projection != "persp")
            throw std::invalid_argument("unknown projection: " + cli.projection);

        if (!cli.preset.empty()) {
            viewer::CameraPreset preset;
            if (!parse_preset(cli.preset, preset)) throw std::invalid_argument("unknown preset: " + cli.preset);
            camera.apply_preset(preset, cfg.camera.preset_duration);
        }

        const FrameSummary frames = simulate(scene, camera, std::max(cli.frames, 0), cli.aspect);
        const auto stats = scene.stats();

        if (cli.json_stdout) {
            std::cout << std::setw(2) << stats_json(*g, stats, frames, build_ms, camera) << '\n';
            return 0;
        }

        std::cerr << "Grid: " << g->width() << "x" << g->height() << ", heights "
                  << g->bounds().min_height << ".." << g->bounds().max_height << '\n';
        std::cerr << "Mode: " << render_domain::render_mode_name(stats.mode) << ", vertices "
                  << stats.total_vertices << ", triangles " << stats.total_triangles << ", chunks "
                  << stats.chunk_count << '\n';
        std::cerr << "Build: " << std::fixed << std::setprecision(1) << build_ms << " ms\n";
        std::cerr << "Frames: " << frames.frames << ", draw items " << frames.min_items << ".."
                  << frames.max_items << ", visible chunks (last) " << stats.visible_chunks << '\n';
        if (stats.resource_warning) std::cerr << "Warning: grid exceeds the maximum dimension\n";
        if (log::verbose_enabled()) {
            const auto& s = camera.camera_state();
            std::cerr << "Average draw items: " << std::setprecision(2)
                      << (frames.frames > 0 ? static_cast<double>(frames.total_items) / frames.frames : 0.0)
                      << '\n';
            std::cerr << "Camera: distance " << s.distance << ", azimuth " << s.azimuth << ", elevation "
                      << s.elevation << ", "
                      << (camera.projection_kind() == viewer::ProjectionKind::Orthographic ? "ortho" : "persp")
                      << '\n';
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    return 0;
}
