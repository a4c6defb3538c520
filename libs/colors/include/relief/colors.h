#pragma once

#include "relief/grid.h"

#include <string>
#include <variant>
#include <vector>

namespace relief::colors {

using Rgb = grid::Rgb;

// Natural terrain gradient: water blue -> cyan -> green -> brown -> snow.
struct HeightGradient {};

// Scientific heatmap: blue -> cyan -> green -> yellow -> red.
struct Heatmap {};

// Single hue, intensity follows height.
struct Monochrome {
    Rgb tint = {1.0f, 1.0f, 1.0f};
};

struct GradientStop {
    float t = 0.0f;
    Rgb color = {0.0f, 0.0f, 0.0f};
};

// Piecewise-linear gradient over user stops. Unsorted stops are sorted on a
// copy for every evaluation; call sort_stops once before evaluating many
// samples. No stops yields black.
struct CustomGradient {
    std::vector<GradientStop> stops;
};

using ColorScheme = std::variant<HeightGradient, Heatmap, Monochrome, CustomGradient>;

// Color for a raw (pre-scale) height inside [min_height, max_height].
// A flat range maps every height to t = 0.
Rgb color_for_height(const ColorScheme& scheme, float height, const grid::HeightBounds& bounds);

// Color for an already normalized t; t is clamped to [0, 1].
Rgb color_at(const ColorScheme& scheme, float t);

// Orders CustomGradient stops by t (stable); other schemes are unchanged.
void sort_stops(ColorScheme& scheme);

Rgb height_gradient(float t);
Rgb heatmap(float t);
Rgb monochrome(float t, const Rgb& tint);
Rgb custom_gradient(float t, const std::vector<GradientStop>& stops);

// Stable names used by the config file and the CLI tools.
std::string scheme_name(const ColorScheme& scheme);
// Parses "terrain", "heatmap", "monochrome" or "custom"; unknown names
// return false and leave out untouched.
bool parse_scheme_name(const std::string& name, ColorScheme& out);

} // namespace relief::colors
