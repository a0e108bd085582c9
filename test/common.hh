// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_TEST_COMMON_HH
#define RESPAN_TEST_COMMON_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <respan/content_stream.hh>
#include <respan/layout.hh>

namespace respan::test {

//
// A horizontal span with fixed-width glyphs:
//
inline layout_span_t
make_span (const std::wstring& s, double x, double y,
           double w = 6, double size = 12, const std::string& font = "F1") {
    layout_span_t span;

    span.font = font;
    span.size = size;
    span.bbox = bbox_t{ x, y, x + w * s.size (), y + size };

    for (size_t i = 0; i < s.size (); ++i) {
        span.chars.push_back ({
                s [i], bbox_t{ x + w * i, y, x + w * (i + 1), y + size } });
    }

    return span;
}

//
// One block, one line per span:
//
inline page_layout_t make_page (const std::vector< layout_span_t >& spans) {
    page_layout_t page;

    page.index = 0;
    page.width = 612;
    page.height = 792;

    page.blocks.emplace_back ();

    for (const auto& span : spans) {
        page.blocks.back ().lines.emplace_back ();
        page.blocks.back ().lines.back ().spans.push_back (span);
    }

    return page;
}

inline operators_t parse (const std::string& s) {
    return parse_content_stream (s);
}

} // namespace respan::test

#endif // RESPAN_TEST_COMMON_HH
