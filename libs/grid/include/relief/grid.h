#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace relief::grid {

// Normalized RGB, 0..1 per channel.
using Rgb = std::array<float, 3>;

struct HeightBounds {
    float min_height = 0.0f;
    float max_height = 0.0f;

    [[nodiscard]] float range() const { return max_height - min_height; }
};

// Rgb from a packed 0xRRGGBB value.
Rgb unpack_rgb(uint32_t rgb);

// HeightGrid is the immutable terrain input: width*height samples stored
// row-major (row = z, column = x) with an optional parallel color array.
// Construction validates the shape and throws std::invalid_argument on a
// mismatch; everything downstream relies on that invariant.
class HeightGrid {
public:
    HeightGrid() = default;
    HeightGrid(uint32_t width, uint32_t height, std::vector<float> samples,
               std::vector<Rgb> colors = {});

    [[nodiscard]] uint32_t width() const { return width_; }
    [[nodiscard]] uint32_t height() const { return height_; }
    [[nodiscard]] size_t sample_count() const { return samples_.size(); }
    [[nodiscard]] bool empty() const { return samples_.empty(); }

    // True when either dimension is below 2: no quad can be formed.
    [[nodiscard]] bool degenerate() const { return width_ < 2 || height_ < 2; }

    [[nodiscard]] float at(uint32_t col, uint32_t row) const {
        return samples_[static_cast<size_t>(row) * width_ + col];
    }

    [[nodiscard]] const std::vector<float>& samples() const { return samples_; }

    [[nodiscard]] bool has_colors() const { return !colors_.empty(); }
    [[nodiscard]] const Rgb& color_at(uint32_t col, uint32_t row) const {
        return colors_[static_cast<size_t>(row) * width_ + col];
    }
    [[nodiscard]] const std::vector<Rgb>& colors() const { return colors_; }

    // Whole-grid bounds, computed once at construction. (0, 0) when empty.
    [[nodiscard]] const HeightBounds& bounds() const { return bounds_; }

    // Bounds of the sub-rectangle [col, col+cols) x [row, row+rows),
    // clipped to the grid. (0, 0) if the clipped rectangle is empty.
    [[nodiscard]] HeightBounds region_bounds(uint32_t col, uint32_t row,
                                             uint32_t cols, uint32_t rows) const;

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<float> samples_;
    std::vector<Rgb> colors_;
    HeightBounds bounds_;
};

} // namespace relief::grid
