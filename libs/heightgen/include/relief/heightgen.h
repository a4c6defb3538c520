#pragma once

#include "relief/grid.h"

#include <cstdint>

namespace relief::heightgen {

struct GenOptions {
    uint32_t width = 256;
    uint32_t height = 256;
    uint64_t seed = 1;
    int octaves = 6;          // clamped to [1, 16]
    float frequency = 0.01f;  // cycles per sample for the first octave
    float lacunarity = 2.0f;  // frequency multiplier per octave
    float gain = 0.5f;        // amplitude multiplier per octave
    float amplitude = 50.0f;  // output height range is [-amplitude, amplitude]
    bool ridged = false;      // 1 - |n| folding; output range becomes [0, amplitude]
};

// Fractal value noise. The same options always give the same grid.
grid::HeightGrid generate(const GenOptions& options);

// Single fBm evaluation at a sample position, normalized to [-1, 1]
// ([0, 1] when ridged).
float fbm(float x, float y, const GenOptions& options);

} // namespace relief::heightgen
