// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_LAYOUT_HH
#define RESPAN_RESPAN_LAYOUT_HH

#include <defs.hh>

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

#include <respan/bbox.hh>
#include <respan/matrix.hh>

namespace respan {

//
// Text geometry of one rendered page, as reported by the rendering layer:
// blocks of lines of spans of characters, in reading order.
//
struct layout_char_t {
    wchar_t c = 0;

    //
    // Absent when the renderer only knows the span geometry:
    //
    std::optional< bbox_t > box;

    //
    // Characters the renderer made up, e.g., inter-word spaces:
    //
    bool synthetic = false;
};

struct layout_span_t {
    std::string font;
    double size = 0;

    bbox_t bbox{ };

    std::optional< point_t > origin;
    point_t direction{ 1, 0 };
    std::optional< matrix_t > matrix;

    double ascent = 0, descent = 0;

    std::vector< layout_char_t > chars;
};

struct layout_line_t {
    std::vector< layout_span_t > spans;
};

struct layout_block_t {
    std::vector< layout_line_t > lines;
};

struct page_layout_t {
    size_t index = 0;
    double width = 0, height = 0;

    std::vector< layout_block_t > blocks;
};

//
// Reads a page layout from its text form:
//
//   page   <index> [<width> <height>]
//   block
//   line
//   span   <font> <size> <x0> <y0> <x1> <y1> [origin <x> <y>] [dir <dx> <dy>]
//          [ascent <a>] [descent <d>] [matrix <a> <b> <c> <d> <e> <f>]
//   char   <hex code> [<x0> <y0> <x1> <y1>] [synthetic]
//
// Malformed lines are reported and skipped; a missing file throws.
//
page_layout_t read_page_layout (std::istream&);
page_layout_t read_page_layout (const fs::path&);

} // namespace respan

#endif // RESPAN_RESPAN_LAYOUT_HH
