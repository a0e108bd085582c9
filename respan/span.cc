// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cwchar>

#include <respan/normalize.hh>
#include <respan/span.hh>

namespace respan {
namespace {

matrix_t
infer_span_matrix (double size, const point_t& origin, const point_t& dir) {
    if (size == 0)
        return identity_matrix ();

    return {
        dir.x * size, dir.y * size, -dir.y * size, dir.x * size,
        origin.x, origin.y
    };
}

void normalize_span (span_record_t& span) {
    for (size_t i = 0; i < span.chars.size (); ++i) {
        const auto& ch = span.chars [i];

        if (is_zero_width (ch.c))
            continue;

        const auto pos = span.normalized_chars.size ();

        if (const auto p = ligature_expansion (ch.c)) {
            //
            // Expanded ligatures share the glyph box, split evenly:
            //
            const size_t n = std::wcslen (p);

            for (size_t j = 0; j < n; ++j) {
                span.normalized_chars.push_back (
                    { p [j], horizontal_part (ch.box, j, n) });
                span.normalized_to_raw.emplace_back (i, i + 1);
            }

            span.graphemes.emplace_back (pos, pos + n);
        }
        else {
            span.normalized_chars.push_back (ch);
            span.normalized_to_raw.emplace_back (i, i + 1);

            if (is_combining (ch.c) && !span.graphemes.empty ()) {
                span.graphemes.back ().second = pos + 1;
            }
            else {
                span.graphemes.emplace_back (pos, pos + 1);
            }
        }
    }

    for (const auto& ch : span.normalized_chars)
        span.normalized_text += ch.c;
}

} // anonymous

std::vector< span_record_ptr > extract_spans (const page_layout_t& page) {
    std::vector< span_record_ptr > xs;

    for (size_t b = 0; b < page.blocks.size (); ++b) {
        const auto& block = page.blocks [b];

        for (size_t l = 0; l < block.lines.size (); ++l) {
            const auto& line = block.lines [l];

            for (size_t s = 0; s < line.spans.size (); ++s) {
                const auto& src = line.spans [s];

                auto span = std::make_shared< span_record_t > ();

                span->page = page.index;
                span->block = b;
                span->line = l;
                span->span = s;

                span->font = src.font;
                span->font_size = src.size;
                span->bbox = src.bbox;
                span->origin = src.origin.value_or (src.bbox.point [0]);
                span->direction = src.direction;
                span->ascent = src.ascent;
                span->descent = src.descent;

                for (const auto& ch : src.chars) {
                    if (ch.synthetic || 0 == ch.c)
                        continue;

                    span->text += ch.c;
                    span->chars.push_back ({ ch.c, ch.box.value_or (src.bbox) });
                }

                if (span->text.empty ())
                    continue;

                span->matrix = src.matrix.value_or (infer_span_matrix (
                    src.size, span->origin, src.direction));

                normalize_span (*span);

                xs.push_back (std::move (span));
            }
        }
    }

    return xs;
}

std::pair< size_t, size_t >
adjust_to_graphemes (const span_record_t& span, size_t start, size_t end) {
    if (end <= start || span.graphemes.empty ())
        return { start, end };

    size_t first = start, last = end;

    for (const auto& [lo, hi] : span.graphemes) {
        if (hi > start) {
            first = lo;
            break;
        }
    }

    for (const auto& [lo, hi] : span.graphemes) {
        if (lo < end && end <= hi) {
            last = hi;
            break;
        }
    }

    return { first, last };
}

} // namespace respan
