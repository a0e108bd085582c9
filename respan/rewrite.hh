// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_REWRITE_HH
#define RESPAN_RESPAN_REWRITE_HH

#include <defs.hh>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <respan/bbox.hh>
#include <respan/content_stream.hh>
#include <respan/match_planner.hh>
#include <respan/matrix.hh>
#include <respan/span.hh>
#include <respan/tracker.hh>

namespace respan {

//
// Where a replacement comes from: the substitution it is part of.
//
struct mapping_ref_t {
    std::wstring original, replacement;

    std::optional< size_t > operator_index;
    std::optional< std::string > label;
};

struct slice_replacement_t {
    //
    // Range in the normalized text of the span:
    //
    size_t start, end;

    std::wstring replacement;
    mapping_ref_t mapping;

    //
    // Set when the caller already knows in-place substitution cannot keep the
    // layout:
    //
    bool overlay_fallback = false;
};

struct validation_failure_t {
    std::wstring expected, observed;

    //
    // Range in the raw text of the span:
    //
    size_t start, end;

    std::wstring replacement;
    std::optional< size_t > operator_index;
};

struct span_rewrite_entry_t {
    size_t page, block, line, span;

    std::optional< size_t > operator_index;

    std::wstring original_text, replacement_text;

    std::string font;
    double font_size;

    bbox_t bbox;
    matrix_t matrix;

    double original_width, replacement_width;

    //
    // Horizontal scale which fits the replacement in the original width, 1
    // when it fits already:
    //
    double scale = 1;

    std::vector< mapping_ref_t > mappings;

    bool overlay_fallback = false, requires_scaling = false;
};

//
// Width of a text set in the given font and size:
//
using width_measure_t = std::function<
    double (const std::wstring&, const std::string&, double) >;

//
// Pending replacements for the text of one span.
//
class span_accumulator_t {
public:
    explicit span_accumulator_t (
        span_record_ptr, double min_scale = RESPAN_MIN_HORIZONTAL_SCALE);

    //
    // Queues a replacement of the normalized range [start, end). A range
    // which covers pending ones replaces them; a range which overlaps a
    // pending one is dropped.
    //
    void add_replacement (size_t start, size_t end, std::wstring replacement,
                          mapping_ref_t, bool overlay_fallback = false);

    //
    // Checks every pending replacement against the current text of the span
    // and, if all match, merges them into one entry. Otherwise records the
    // mismatches and returns nothing.
    //
    std::optional< span_rewrite_entry_t >
    build_entry (size_t page, const width_measure_t&);

    const span_record_t& span () const { return *span_; }

    const std::vector< slice_replacement_t >& replacements () const {
        return replacements_;
    }

    const std::vector< validation_failure_t >& failures () const {
        return failures_;
    }

private:
    std::pair< size_t, size_t > raw_bounds (size_t, size_t) const;

private:
    span_record_ptr span_;
    double min_scale_;

    std::vector< slice_replacement_t > replacements_;
    std::vector< validation_failure_t > failures_;
};

//
// Block, line and span index:
//
using span_key_t = std::tuple< size_t, size_t, size_t >;

using span_accumulators_t = std::map< span_key_t, span_accumulator_t >;

//
// Queues the match segments of a plan with the accumulators of the spans
// they render in, sharing each segment's planned text among its slices.
//
void accumulate_plan (span_accumulators_t&, const replacement_plan_t&,
                      double min_scale = RESPAN_MIN_HORIZONTAL_SCALE);

//
// Rewrites the text-show operators touched by the plan; all other operators,
// and the untouched strings of touched operators, are kept as they are.
//
operators_t
apply_plan (const operators_t&, const operator_records_t&,
            const replacement_plan_t&);

} // namespace respan

#endif // RESPAN_RESPAN_REWRITE_HH
