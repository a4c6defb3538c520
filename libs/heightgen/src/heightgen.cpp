#include "relief/heightgen.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

namespace relief::heightgen {

namespace {

constexpr int kMaxOctaves = 16;

// SplitMix64 stream, used to derive per-octave seeds and offsets.
struct Rng32 {
    uint64_t state;

    explicit Rng32(uint64_t seed) : state(seed ? seed : 0x9E3779B97F4A7C15ULL) {}

    [[nodiscard]] uint32_t next_u32() {
        uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return static_cast<uint32_t>(z ^ (z >> 31));
    }

    [[nodiscard]] float next_f32() {
        return static_cast<float>((next_u32() >> 8) * (1.0 / 16777216.0));
    }
};

struct Octave {
    uint32_t seed = 0;
    float offset_x = 0.0f;
    float offset_y = 0.0f;
};

[[nodiscard]] uint32_t hash2d(int x, int y, uint32_t seed) {
    uint32_t h = seed ^ 0x9E3779B9u;
    h ^= static_cast<uint32_t>(x) * 0x85EBCA6Bu;
    h = (h << 13) | (h >> 19);
    h ^= static_cast<uint32_t>(y) * 0xC2B2AE35u;
    h ^= (h >> 16);
    h *= 0x7FEB352Du;
    h ^= (h >> 15);
    h *= 0x846CA68Bu;
    return h ^ (h >> 16);
}

// Smoothstep-interpolated lattice noise in [-1, 1].
[[nodiscard]] float value_noise(float x, float y, uint32_t seed) {
    const int ix = static_cast<int>(std::floor(x));
    const int iy = static_cast<int>(std::floor(y));
    const float fx = x - static_cast<float>(ix);
    const float fy = y - static_cast<float>(iy);

    const auto v = [seed](int xx, int yy) {
        return static_cast<float>((hash2d(xx, yy, seed) & 0x00FFFFFFu) / 8388607.5 - 1.0);
    };

    const float a = v(ix, iy);
    const float b = v(ix + 1, iy);
    const float c = v(ix, iy + 1);
    const float d = v(ix + 1, iy + 1);

    const float ux = fx * fx * (3.0f - 2.0f * fx);
    const float uy = fy * fy * (3.0f - 2.0f * fy);
    const float ab = a + (b - a) * ux;
    const float cd = c + (d - c) * ux;
    return std::clamp(ab + (cd - ab) * uy, -1.0f, 1.0f);
}

[[nodiscard]] int octave_count(const GenOptions& options) {
    return std::clamp(options.octaves, 1, kMaxOctaves);
}

[[nodiscard]] std::array<Octave, kMaxOctaves> make_octaves(const GenOptions& options) {
    std::array<Octave, kMaxOctaves> out{};
    Rng32 rng(options.seed);
    for (auto& o : out) {
        o.seed = rng.next_u32();
        o.offset_x = rng.next_f32() * 4096.0f;
        o.offset_y = rng.next_f32() * 4096.0f;
    }
    return out;
}

[[nodiscard]] float fbm_with(float x, float y, const GenOptions& options,
                             const std::array<Octave, kMaxOctaves>& octaves) {
    const int count = octave_count(options);
    float amp = 1.0f;
    float freq = options.frequency;
    float sum = 0.0f;
    float norm = 0.0f;
    for (int i = 0; i < count; ++i) {
        const Octave& o = octaves[static_cast<size_t>(i)];
        float n = value_noise(x * freq + o.offset_x, y * freq + o.offset_y, o.seed);
        if (options.ridged) {
            n = 1.0f - std::fabs(n);
            n *= n;
        }
        sum += amp * n;
        norm += std::fabs(amp);
        amp *= options.gain;
        freq *= options.lacunarity;
    }
    return norm > 0.0f ? sum / norm : 0.0f;
}

} // namespace

float fbm(float x, float y, const GenOptions& options) {
    return fbm_with(x, y, options, make_octaves(options));
}

grid::HeightGrid generate(const GenOptions& options) {
    const auto octaves = make_octaves(options);
    std::vector<float> samples;
    samples.reserve(static_cast<size_t>(options.width) * options.height);
    for (uint32_t row = 0; row < options.height; ++row) {
        for (uint32_t col = 0; col < options.width; ++col) {
            const float n = fbm_with(static_cast<float>(col), static_cast<float>(row), options, octaves);
            samples.push_back(n * options.amplitude);
        }
    }
    return grid::HeightGrid(options.width, options.height, std::move(samples));
}

} // namespace relief::heightgen
