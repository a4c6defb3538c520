#include "relief/grid.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace relief::grid {

Rgb unpack_rgb(uint32_t rgb) {
    return {
        static_cast<float>((rgb >> 16) & 0xFFu) / 255.0f,
        static_cast<float>((rgb >> 8) & 0xFFu) / 255.0f,
        static_cast<float>(rgb & 0xFFu) / 255.0f,
    };
}

HeightGrid::HeightGrid(uint32_t width, uint32_t height, std::vector<float> samples,
                       std::vector<Rgb> colors)
    : width_(width), height_(height), samples_(std::move(samples)), colors_(std::move(colors)) {
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (samples_.size() != expected) {
        throw std::invalid_argument("grid: " + std::to_string(samples_.size()) + " samples for a "
                                    + std::to_string(width) + "x" + std::to_string(height) + " grid");
    }
    if (!colors_.empty() && colors_.size() != samples_.size()) {
        throw std::invalid_argument("grid: " + std::to_string(colors_.size()) + " colors for "
                                    + std::to_string(samples_.size()) + " samples");
    }
    bounds_ = region_bounds(0, 0, width_, height_);
}

HeightBounds HeightGrid::region_bounds(uint32_t col, uint32_t row,
                                       uint32_t cols, uint32_t rows) const {
    if (col >= width_ || row >= height_) return {};
    const auto col_end = static_cast<uint32_t>(std::min<uint64_t>(static_cast<uint64_t>(col) + cols, width_));
    const auto row_end = static_cast<uint32_t>(std::min<uint64_t>(static_cast<uint64_t>(row) + rows, height_));
    if (col_end <= col || row_end <= row) return {};

    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    for (uint32_t r = row; r < row_end; ++r) {
        const float* line = samples_.data() + static_cast<size_t>(r) * width_;
        for (uint32_t c = col; c < col_end; ++c) {
            lo = std::min(lo, line[c]);
            hi = std::max(hi, line[c]);
        }
    }
    return {lo, hi};
}

} // namespace relief::grid
