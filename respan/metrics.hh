// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_METRICS_HH
#define RESPAN_RESPAN_METRICS_HH

#include <defs.hh>

#include <optional>

#include <respan/span.hh>
#include <respan/tracker.hh>

namespace respan {

//
// Advance of the run of glyphs covered by the slices, measured along the
// writing direction of the first span: the extent of each slice plus the
// positive gaps between consecutive slices. Nothing for empty slices.
//
std::optional< advance_metrics_t > compute_advance (const span_slices_t&);

//
// Metrics synthesized from the operator's own state and advance, for
// operators without span alignment:
//
std::optional< advance_metrics_t > fallback_metrics (const operator_record_t&);

//
// Unit writing direction of the text space, in device space:
//
point_t writing_direction (const matrix_t& ctm, const matrix_t& tm);

} // namespace respan

#endif // RESPAN_RESPAN_METRICS_HH
