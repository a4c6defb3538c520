#include "relief/colors.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace relief::colors {

namespace {

[[nodiscard]] Rgb lerp_rgb(const Rgb& a, const Rgb& b, float s) {
    return {a[0] + (b[0] - a[0]) * s, a[1] + (b[1] - a[1]) * s, a[2] + (b[2] - a[2]) * s};
}

[[nodiscard]] bool stop_less(const GradientStop& a, const GradientStop& b) { return a.t < b.t; }

} // namespace

void sort_stops(ColorScheme& scheme) {
    if (auto* custom = std::get_if<CustomGradient>(&scheme)) {
        std::stable_sort(custom->stops.begin(), custom->stops.end(), stop_less);
    }
}

Rgb height_gradient(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    if (t < 0.3f) {
        const float s = t / 0.3f;
        return {0.0f, s * 0.5f, 0.8f + s * 0.2f};
    }
    if (t < 0.5f) {
        const float s = (t - 0.3f) / 0.2f;
        return {s * 0.2f, 0.5f + s * 0.3f, 1.0f - s * 0.6f};
    }
    if (t < 0.8f) {
        const float s = (t - 0.5f) / 0.3f;
        return {0.2f + s * 0.4f, 0.8f - s * 0.4f, 0.4f - s * 0.3f};
    }
    const float s = (t - 0.8f) / 0.2f;
    return {0.6f + s * 0.4f, 0.4f + s * 0.6f, 0.1f + s * 0.9f};
}

Rgb heatmap(float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    if (t < 0.25f) return {0.0f, t / 0.25f, 1.0f};
    if (t < 0.5f) return {0.0f, 1.0f, 1.0f - (t - 0.25f) / 0.25f};
    if (t < 0.75f) return {(t - 0.5f) / 0.25f, 1.0f, 0.0f};
    return {1.0f, 1.0f - (t - 0.75f) / 0.25f, 0.0f};
}

Rgb monochrome(float t, const Rgb& tint) {
    const float v = 0.1f + std::clamp(t, 0.0f, 1.0f) * 0.9f;
    return {v * tint[0], v * tint[1], v * tint[2]};
}

Rgb custom_gradient(float t, const std::vector<GradientStop>& stops) {
    if (stops.empty()) return {0.0f, 0.0f, 0.0f};
    t = std::clamp(t, 0.0f, 1.0f);

    if (!std::is_sorted(stops.begin(), stops.end(), stop_less)) {
        std::vector<GradientStop> copy = stops;
        std::stable_sort(copy.begin(), copy.end(), stop_less);
        return custom_gradient(t, copy);
    }

    const std::vector<GradientStop>& sorted = stops;
    if (t <= sorted.front().t) return sorted.front().color;
    if (t >= sorted.back().t) return sorted.back().color;
    for (size_t i = 1; i < sorted.size(); ++i) {
        const GradientStop& hi = sorted[i];
        if (t > hi.t) continue;
        const GradientStop& lo = sorted[i - 1];
        const float span = hi.t - lo.t;
        if (span <= 0.0f) return hi.color;
        return lerp_rgb(lo.color, hi.color, (t - lo.t) / span);
    }
    return sorted.back().color;
}

Rgb color_at(const ColorScheme& scheme, float t) {
    return std::visit([t](const auto& s) -> Rgb {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, HeightGradient>) return height_gradient(t);
        else if constexpr (std::is_same_v<S, Heatmap>) return heatmap(t);
        else if constexpr (std::is_same_v<S, Monochrome>) return monochrome(t, s.tint);
        else return custom_gradient(t, s.stops);
    }, scheme);
}

Rgb color_for_height(const ColorScheme& scheme, float height, const grid::HeightBounds& bounds) {
    const float range = bounds.range();
    const float t = (std::fabs(range) < 1e-6f) ? 0.0f : (height - bounds.min_height) / range;
    return color_at(scheme, t);
}

std::string scheme_name(const ColorScheme& scheme) {
    return std::visit([](const auto& s) -> std::string {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, HeightGradient>) return "terrain";
        else if constexpr (std::is_same_v<S, Heatmap>) return "heatmap";
        else if constexpr (std::is_same_v<S, Monochrome>) return "monochrome";
        else {
            static_assert(std::is_same_v<S, CustomGradient>, "unnamed color scheme");
            return "custom";
        }
    }, scheme);
}

bool parse_scheme_name(const std::string& name, ColorScheme& out) {
    if (name == "terrain") out = HeightGradient{};
    else if (name == "heatmap") out = Heatmap{};
    else if (name == "monochrome") out = Monochrome{};
    else if (name == "custom") {
        if (!std::holds_alternative<CustomGradient>(out)) out = CustomGradient{};
    } else {
        return false;
    }
    return true;
}

} // namespace relief::colors
