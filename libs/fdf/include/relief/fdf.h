#pragma once

#include "relief/grid.h"

#include <cstddef>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace relief::fdf {

enum class ErrorKind {
    CannotOpen,
    BadNumber,
    BadColor,
    InconsistentRow,
    EmptyFile,
};

const char* error_kind_name(ErrorKind kind);

// ParseError is thrown for any malformed or unreadable .fdf input. line is
// 1-based and 0 when the error is not tied to a line.
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, size_t line, const std::string& message);

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] size_t line() const { return line_; }

private:
    ErrorKind kind_;
    size_t line_;
};

// parse reads a grid: one row per non-empty line, whitespace-separated values
// of the form "height" or "height,0xRRGGBB". When any value carries a color,
// values without one are white; otherwise the grid has no colors.
grid::HeightGrid parse(std::istream& in);
grid::HeightGrid parse_string(std::string_view text);

// load opens path and parses it.
grid::HeightGrid load(const std::string& path);

// write emits the grid in the same format; colors are written when present.
void write(std::ostream& out, const grid::HeightGrid& grid);

} // namespace relief::fdf
