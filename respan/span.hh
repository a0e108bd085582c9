// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_SPAN_HH
#define RESPAN_RESPAN_SPAN_HH

#include <defs.hh>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <respan/bbox.hh>
#include <respan/layout.hh>
#include <respan/matrix.hh>

namespace respan {

struct span_char_t {
    wchar_t c;
    bbox_t box;
};

//
// One visually rendered run of text. The normalized view expands ligatures
// and drops zero-width characters; the raw view keeps every character the
// renderer reported.
//
struct span_record_t {
    size_t page, block, line, span;

    std::wstring text;

    std::string font;
    double font_size;

    bbox_t bbox;
    point_t origin, direction;
    matrix_t matrix;

    double ascent, descent;

    std::vector< span_char_t > chars;

    std::wstring normalized_text;
    std::vector< span_char_t > normalized_chars;

    //
    // [start, end) ranges over normalized_text, one per visual character
    // cluster, partitioning it:
    //
    std::vector< std::pair< size_t, size_t > > graphemes;

    //
    // For each normalized character, the [start, end) range of raw
    // characters it comes from:
    //
    std::vector< std::pair< size_t, size_t > > normalized_to_raw;
};

using span_record_ptr = std::shared_ptr< const span_record_t >;

//
// A sub-range of the normalized characters of one span:
//
struct span_slice_t {
    span_record_ptr span;
    size_t start, end;

    size_t size () const { return end - start; }
};

using span_slices_t = std::vector< span_slice_t >;

inline bool
operator== (const span_slice_t& lhs, const span_slice_t& rhs) {
    return
        lhs.span == rhs.span && lhs.start == rhs.start && lhs.end == rhs.end;
}

inline size_t length_of (const span_slices_t& xs) {
    size_t n = 0;

    for (const auto& x : xs)
        n += x.size ();

    return n;
}

//
// Collects the spans of a rendered page, in block, line and span order.
// Spans without text are skipped; a page without text yields no spans.
//
std::vector< span_record_ptr > extract_spans (const page_layout_t&);

//
// Widens [start, end) to whole grapheme clusters of the span:
//
std::pair< size_t, size_t >
adjust_to_graphemes (const span_record_t&, size_t, size_t);

} // namespace respan

#endif // RESPAN_RESPAN_SPAN_HH
