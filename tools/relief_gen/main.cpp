#include "relief/fdf.h"
#include "relief/heightgen.h"
#include "relief/log.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace hg = relief::heightgen;

struct Cli {
    std::string out_path;
    hg::GenOptions gen;
    int verbosity = 0;
};

static void usage() {
    std::cerr
        << "Usage: relief_gen [flags] <output.fdf|->\n\n"
        << "Writes a procedurally generated heightmap in .fdf format.\n\n"
        << "Flags:\n"
        << "  --width N --height N   Grid size in samples (default: 256x256)\n"
        << "  --seed N               Noise seed (default: 1)\n"
        << "  --octaves N            fBm octaves, 1..16 (default: 6)\n"
        << "  --frequency F          First octave frequency (default: 0.01)\n"
        << "  --lacunarity F         Frequency gain per octave (default: 2)\n"
        << "  --gain F               Amplitude gain per octave (default: 0.5)\n"
        << "  --amplitude F          Height range (default: 50)\n"
        << "  --ridged               Ridged noise\n"
        << "  -v, --verbose          Enable verbose logging\n";
}

static int parse_cli(int argc, char** argv, Cli& cli) {
    std::vector<std::string> pos;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--width") == 0 && i + 1 < argc)
            cli.gen.width = static_cast<uint32_t>(std::stoul(argv[++i]));
        else if (std::strcmp(argv[i], "--height") == 0 && i + 1 < argc)
            cli.gen.height = static_cast<uint32_t>(std::stoul(argv[++i]));
        else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) cli.gen.seed = std::stoull(argv[++i]);
        else if (std::strcmp(argv[i], "--octaves") == 0 && i + 1 < argc) cli.gen.octaves = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--frequency") == 0 && i + 1 < argc) cli.gen.frequency = std::stof(argv[++i]);
        else if (std::strcmp(argv[i], "--lacunarity") == 0 && i + 1 < argc) cli.gen.lacunarity = std::stof(argv[++i]);
        else if (std::strcmp(argv[i], "--gain") == 0 && i + 1 < argc) cli.gen.gain = std::stof(argv[++i]);
        else if (std::strcmp(argv[i], "--amplitude") == 0 && i + 1 < argc) cli.gen.amplitude = std::stof(argv[++i]);
        else if (std::strcmp(argv[i], "--ridged") == 0) cli.gen.ridged = true;
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            cli.verbosity = std::min(cli.verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage();
            return 2;
        } else {
            pos.emplace_back(argv[i]);
        }
    }
    if (pos.size() != 1) {
        usage();
        return 1;
    }
    cli.out_path = pos[0];
    if (cli.gen.width < 2 || cli.gen.height < 2) {
        std::cerr << "Error: width and height must be at least 2\n";
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    Cli cli;
    try {
        if (int rc = parse_cli(argc, argv, cli); rc != 0) return rc == 2 ? 0 : rc;
        relief::log::set_verbosity(cli.verbosity);

        LOGI("Generating", cli.gen.width, "x", cli.gen.height, "seed", cli.gen.seed,
             cli.gen.ridged ? "ridged" : "fbm");
        const auto grid = hg::generate(cli.gen);

        if (cli.out_path == "-") {
            relief::fdf::write(std::cout, grid);
            return 0;
        }

        const auto parent = fs::path(cli.out_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
        std::ofstream out(cli.out_path);
        if (!out) throw std::runtime_error("creating " + cli.out_path);
        relief::fdf::write(out, grid);
        if (!out) throw std::runtime_error("writing " + cli.out_path);

        LOGI("Wrote", cli.out_path, "heights", grid.bounds().min_height, "..", grid.bounds().max_height);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    return 0;
}
