#include "relief/fdf.h"

#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace relief::fdf {

namespace {

constexpr uint32_t kWhite = 0xFFFFFF;

std::string line_prefix(size_t line) {
    return "fdf: line " + std::to_string(line) + ": ";
}

float parse_height(std::string_view s, size_t line) {
    std::string_view digits = s;
    if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);
    float v = 0.0f;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() || !std::isfinite(v)) {
        throw ParseError(ErrorKind::BadNumber, line,
                         line_prefix(line) + "expected number, got '" + std::string(s) + "'");
    }
    return v;
}

uint32_t parse_color(std::string_view s, size_t line) {
    std::string_view hex = s;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) hex.remove_prefix(2);
    uint32_t v = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), v, 16);
    if (hex.empty() || ec != std::errc{} || ptr != hex.data() + hex.size()) {
        throw ParseError(ErrorKind::BadColor, line,
                         line_prefix(line) + "invalid color '" + std::string(s) + "'");
    }
    return v & 0xFFFFFFu;
}

uint32_t pack_rgb(const grid::Rgb& c) {
    auto channel = [](float f) {
        const float clamped = f < 0.0f ? 0.0f : (f > 1.0f ? 1.0f : f);
        return static_cast<uint32_t>(std::lround(clamped * 255.0f));
    };
    return (channel(c[0]) << 16) | (channel(c[1]) << 8) | channel(c[2]);
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CannotOpen: return "cannot open";
        case ErrorKind::BadNumber: return "bad number";
        case ErrorKind::BadColor: return "bad color";
        case ErrorKind::InconsistentRow: return "inconsistent row";
        case ErrorKind::EmptyFile: return "empty file";
    }
    return "unknown";
}

ParseError::ParseError(ErrorKind kind, size_t line, const std::string& message)
    : std::runtime_error(message), kind_(kind), line_(line) {}

grid::HeightGrid parse(std::istream& in) {
    std::vector<float> samples;
    std::vector<uint32_t> packed;
    bool has_color = false;
    size_t width = 0;
    size_t rows = 0;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        std::istringstream tokens(line);
        std::string token;
        size_t count = 0;
        while (tokens >> token) {
            const auto comma = token.find(',');
            const std::string_view tv(token);
            if (comma == std::string::npos) {
                samples.push_back(parse_height(tv, line_no));
                packed.push_back(kWhite);
            } else {
                samples.push_back(parse_height(tv.substr(0, comma), line_no));
                packed.push_back(parse_color(tv.substr(comma + 1), line_no));
                has_color = true;
            }
            count++;
        }
        if (count == 0) continue;

        if (rows == 0) {
            width = count;
        } else if (count != width) {
            throw ParseError(ErrorKind::InconsistentRow, line_no,
                             line_prefix(line_no) + "row has " + std::to_string(count) +
                                 " values, expected " + std::to_string(width));
        }
        rows++;
    }

    if (rows == 0) throw ParseError(ErrorKind::EmptyFile, 0, "fdf: file is empty");

    std::vector<grid::Rgb> colors;
    if (has_color) {
        colors.reserve(packed.size());
        for (uint32_t c : packed) colors.push_back(grid::unpack_rgb(c));
    }
    return grid::HeightGrid(static_cast<uint32_t>(width), static_cast<uint32_t>(rows),
                            std::move(samples), std::move(colors));
}

grid::HeightGrid parse_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    return parse(in);
}

grid::HeightGrid load(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ParseError(ErrorKind::CannotOpen, 0, "fdf: cannot open " + path);
    return parse(f);
}

void write(std::ostream& out, const grid::HeightGrid& grid) {
    std::array<char, 64> buf{};
    for (uint32_t row = 0; row < grid.height(); ++row) {
        for (uint32_t col = 0; col < grid.width(); ++col) {
            if (col > 0) out << ' ';
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), grid.at(col, row));
            if (ec != std::errc{}) throw std::runtime_error("fdf: cannot format height");
            out.write(buf.data(), ptr - buf.data());
            if (grid.has_colors()) {
                auto [cptr, cec] = std::to_chars(buf.data(), buf.data() + buf.size(),
                                                 pack_rgb(grid.color_at(col, row)), 16);
                if (cec != std::errc{}) throw std::runtime_error("fdf: cannot format color");
                out << ",0x";
                out.write(buf.data(), cptr - buf.data());
            }
        }
        out << '\n';
    }
}

} // namespace relief::fdf
