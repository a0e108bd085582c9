// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_MATCH_PLANNER_HH
#define RESPAN_RESPAN_MATCH_PLANNER_HH

#include <defs.hh>

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <respan/alignment.hh>
#include <respan/matrix.hh>
#include <respan/span.hh>
#include <respan/tracker.hh>

namespace respan {

struct match_not_found_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum struct segment_role_t { prefix, match, suffix };

const char* name_of (segment_role_t);

//
// A run of one operator's decoded text, either replaced (match) or flanking
// the replaced text (prefix, suffix):
//
struct replacement_segment_t {
    size_t operator_index;
    segment_role_t role;

    //
    // Original text of the segment, and its range in the operator's text:
    //
    std::wstring text;
    size_t local_start, local_end;

    span_slices_t slices;

    //
    // Placement of the first glyph, and the rendered width of the segment:
    //
    matrix_t matrix;
    double width = 0;

    std::optional< std::string > font;
    double font_size = 0;

    literal_kind_t literal_kind = literal_kind_t::none;

    //
    // Set for match segments which consume a whole TJ array string and are
    // replaced by nothing; the string is removed from the array:
    //
    bool requires_isolation = false;

    //
    // Match segments only: the range of the replacement text this segment
    // renders, and that text:
    //
    std::optional< size_t > replacement_start, replacement_end;
    std::wstring planned_text;
};

using replacement_segments_t = std::vector< replacement_segment_t >;

struct replacement_plan_t {
    size_t page;

    std::wstring original_text, replacement_text;

    //
    // Ordered by operator, then by offset:
    //
    replacement_segments_t segments;
};

//
// [start, end) in the concatenated operator text:
//
struct match_range_t {
    size_t start, end;
};

//
// Locates a target in a text:
//
using match_strategy_t = std::function<
    std::optional< match_range_t > (const std::wstring&, const std::wstring&) >;

std::optional< match_range_t >
exact_match (const std::wstring& text, const std::wstring& target);

//
// Ignores white-space in both the text and the target; the range covers the
// original text from the first to the last matching character:
//
std::optional< match_range_t >
whitespace_insensitive_match (const std::wstring& text,
                              const std::wstring& target);

//
// Exact, then white-space insensitive:
//
const std::vector< match_strategy_t >& default_match_strategies ();

//
// Describes how to render `replacement' in place of the first occurrence of
// `target' in the text of the operators. Throws match_not_found_error when
// none of the strategies finds the target.
//
replacement_plan_t
build_replacement_plan (size_t page,
                        const std::wstring& target,
                        const std::wstring& replacement,
                        const operator_records_t&,
                        const alignment_t&,
                        const std::vector< match_strategy_t >& =
                        default_match_strategies ());

//
// Splits the replacement text over segments of the given original lengths,
// proportionally; the pieces concatenate to the replacement text.
//
std::vector< std::wstring >
allocate_replacement (const std::wstring&, const std::vector< size_t >&);

//
// Sub-slices covering [start, end) of the concatenated slices:
//
span_slices_t slice_span_slices (const span_slices_t&, size_t, size_t);

} // namespace respan

#endif // RESPAN_RESPAN_MATCH_PLANNER_HH
