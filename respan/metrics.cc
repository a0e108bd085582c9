// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>

#include <respan/metrics.hh>

namespace respan {

namespace {

struct extent_t {
    double lo, hi;
    point_t direction;
};

std::optional< extent_t > extent_of (const span_slice_t& slice) {
    const auto& chars = slice.span->normalized_chars;

    if (slice.end <= slice.start || slice.start >= chars.size ())
        return { };

    const auto direction = detail::unit_of (slice.span->direction);

    const auto end = (std::min) (slice.end, chars.size ());

    auto [lo, hi] = project (chars [slice.start].box, direction);

    for (size_t i = slice.start + 1; i < end; ++i) {
        const auto [a, b] = project (chars [i].box, direction);

        lo = (std::min) (lo, a);
        hi = (std::max) (hi, b);
    }

    return extent_t{ lo, hi, direction };
}

} // anonymous

std::optional< advance_metrics_t >
compute_advance (const span_slices_t& slices) {
    std::optional< advance_metrics_t > metrics;

    for (const auto& slice : slices) {
        const auto extent = extent_of (slice);

        if (!extent)
            continue;

        if (!metrics) {
            metrics = advance_metrics_t{
                0, extent->lo, extent->hi, extent->direction };
        }
        else if (extent->lo > metrics->end) {
            metrics->advance += extent->lo - metrics->end;
        }

        metrics->advance += (std::max) (extent->hi - extent->lo, 0.);
        metrics->end = extent->hi;
    }

    return metrics;
}

point_t writing_direction (const matrix_t& ctm, const matrix_t& tm) {
    const auto m = ctm * tm;

    point_t direction{ m.a, m.b };

    if (std::fabs (m.a) <= 1e-9 && std::fabs (m.b) <= 1e-9)
        direction = { m.c, m.d };

    return detail::unit_of (direction, 1e-9);
}

std::optional< advance_metrics_t >
fallback_metrics (const operator_record_t& record) {
    if (!record.has_text () || !record.advance || 0 == *record.advance)
        return { };

    const auto& state = record.state;

    const auto direction = writing_direction (state.ctm, state.text_matrix);
    const auto start = translation_of (state.ctm * state.text_matrix);

    const auto advance = *record.advance;

    const point_t end{
        start.x + direction.x * advance, start.y + direction.y * advance };

    return advance_metrics_t{
        advance, dot (start, direction), dot (end, direction), direction };
}

} // namespace respan
