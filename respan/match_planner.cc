// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>

#include <respan/Error.hh>
#include <respan/match_planner.hh>
#include <respan/normalize.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

namespace respan {

const char* name_of (segment_role_t role) {
    static const char* arr [] = { "prefix", "match", "suffix" };
    return arr [size_t (role)];
}

std::optional< match_range_t >
exact_match (const std::wstring& text, const std::wstring& target) {
    if (target.empty ())
        return { };

    const auto off = text.find (target);

    if (off == std::wstring::npos)
        return { };

    return match_range_t{ off, off + target.size () };
}

std::optional< match_range_t >
whitespace_insensitive_match (const std::wstring& text,
                              const std::wstring& target) {
    std::vector< size_t > ignore, offsets;

    const auto needle = strip_whitespace (target, ignore);

    if (needle.empty ())
        return { };

    const auto haystack = strip_whitespace (text, offsets);
    const auto off = haystack.find (needle);

    if (off == std::wstring::npos)
        return { };

    return match_range_t{
        offsets [off], offsets [off + needle.size () - 1] + 1 };
}

const std::vector< match_strategy_t >& default_match_strategies () {
    static const std::vector< match_strategy_t > strategies{
        exact_match, whitespace_insensitive_match
    };

    return strategies;
}

span_slices_t
slice_span_slices (const span_slices_t& slices, size_t start, size_t end) {
    span_slices_t result;

    if (end <= start)
        return result;

    size_t consumed = 0;

    for (const auto& slice : slices) {
        if (slice.end <= slice.start)
            continue;

        const auto lo = consumed, hi = consumed + slice.size ();
        consumed = hi;

        if (hi <= start)
            continue;

        if (lo >= end)
            break;

        result.push_back ({
                slice.span,
                slice.start + (std::max) (start, lo) - lo,
                slice.start + (std::min) (end, hi) - lo });

        if (hi >= end)
            break;
    }

    return result;
}

std::vector< std::wstring >
allocate_replacement (const std::wstring& s, const std::vector< size_t >& xs) {
    std::vector< std::wstring > pieces;

    if (xs.empty ())
        return pieces;

    size_t remaining_chars = s.size (), cursor = 0;

    size_t remaining_total = 0;
    for (auto x : xs)
        remaining_total += x;

    for (size_t i = 0; i < xs.size (); ++i) {
        const auto n = xs [i];

        if (i + 1 == xs.size ()) {
            pieces.push_back (s.substr (cursor));
            break;
        }

        const size_t remaining_positive = count_if (
            xs.begin () + i + 1, xs.end (), [](auto x) { return x > 0; });

        size_t share;

        if (remaining_total) {
            share = size_t (std::lround (
                double (remaining_chars) * n / remaining_total));
        }
        else {
            share = remaining_chars / (xs.size () - i);
        }

        //
        // Leave at least one character for each of the later segments which
        // cover some original text:
        //
        const auto max_allowed = remaining_chars > remaining_positive
            ? remaining_chars - remaining_positive : 0;

        share = (std::min) (share, max_allowed);

        if (n > 0 && 0 == share && remaining_chars > remaining_positive)
            share = 1;

        pieces.push_back (s.substr (cursor, share));

        cursor += share;
        remaining_chars -= share;
        remaining_total -= n;
    }

    return pieces;
}

namespace {

struct literal_range_t {
    size_t start, end;
    operand_kind_t kind;
};

std::vector< literal_range_t >
literal_ranges_of (const operator_record_t& record) {
    std::vector< literal_range_t > xs;

    size_t cursor = 0, i = 0;

    for (auto kind : record.operand_kinds) {
        if (kind == operand_kind_t::number || i >= record.fragments.size ())
            continue;

        const auto n = record.fragments [i++].size ();
        xs.push_back ({ cursor, cursor + n, kind });

        cursor += n;
    }

    return xs;
}

literal_kind_t
literal_kind_of (const operator_record_t& record, size_t start, size_t end) {
    std::set< operand_kind_t > kinds;

    for (const auto& x : literal_ranges_of (record)) {
        if (end <= x.start || start >= x.end)
            continue;

        kinds.insert (x.kind);
    }

    if (1 == kinds.size ()) {
        switch (*kinds.begin ()) {
        case operand_kind_t::text: return literal_kind_t::text;
        case operand_kind_t::byte: return literal_kind_t::byte;
        default:
            break;
        }
    }

    return literal_kind_t::none;
}

//
// Glyph space of the first character of the slices:
//
matrix_t matrix_of (const span_slices_t& slices) {
    if (slices.empty ())
        return identity_matrix ();

    const auto& slice = slices.front ();
    const auto& span = *slice.span;

    const auto& chars = span.normalized_chars;

    if (chars.empty ())
        return span.matrix;

    const auto i = (std::min) (slice.start, chars.size () - 1);
    const auto& box = chars [i].box;

    const auto u = detail::unit_of (span.direction);
    const auto s = span.font_size;

    return {
        u.x * s, u.y * s, -u.y * s, u.x * s, box.arr [0], box.arr [1] };
}

//
// The text matrix of the operator, or, for runs which end the operator's
// text, the matrix in effect after it, when the slices do not give a usable
// placement:
//
matrix_t
matrix_of (const operator_record_t& record, const span_slices_t& slices,
           size_t start, size_t end) {
    const auto total = record.text ().size ();

    auto fallback = record.state.text_matrix;

    if (record.post_text_matrix && total > 0 &&
        (start >= total || (start > 0 && end >= total)))
        fallback = *record.post_text_matrix;

    if (slices.empty ())
        return fallback;

    const auto m = matrix_of (slices);

    if (is_identity (m))
        return fallback;

    if (is_zero_translation (m) && !is_zero_translation (fallback))
        return fallback;

    return m;
}

double rendered_width (const span_slices_t& slices) {
    double width = 0;

    for (const auto& slice : slices) {
        const auto& chars = slice.span->normalized_chars;

        for (size_t i = slice.start; i < slice.end && i < chars.size (); ++i)
            width += (std::max) (0., width_of (chars [i].box));
    }

    return width;
}

replacement_segment_t
make_segment (const operator_record_t& record, const std::wstring& text,
              segment_role_t role, size_t start, size_t end,
              span_slices_t slices) {
    replacement_segment_t segment{ record.index, role };

    segment.text = text.substr (start, end - start);

    segment.local_start = start;
    segment.local_end = end;

    segment.matrix = matrix_of (record, slices, start, end);
    segment.width = rendered_width (slices);

    segment.slices = std::move (slices);

    segment.font = record.state.font;
    segment.font_size = record.state.font_size;

    segment.literal_kind = literal_kind_of (record, start, end);

    return segment;
}

//
// Consecutive slices of the same span:
//
std::vector< span_slices_t > group_by_span (const span_slices_t& slices) {
    std::vector< span_slices_t > groups;

    for (const auto& slice : slices) {
        if (groups.empty () || groups.back ().back ().span != slice.span)
            groups.emplace_back ();

        groups.back ().push_back (slice);
    }

    return groups;
}

//
// Splits [start, end) at the boundaries of the literals it crosses:
//
std::vector< std::pair< size_t, size_t > >
split_by_literals (const std::vector< literal_range_t >& literals,
                   size_t start, size_t end) {
    std::vector< std::pair< size_t, size_t > > xs;

    size_t cursor = start;

    for (const auto& x : literals) {
        const auto lo = (std::max) (start, x.start);
        const auto hi = (std::min) (end, x.end);

        if (hi <= lo)
            continue;

        if (lo > cursor)
            xs.emplace_back (cursor, lo);

        xs.emplace_back (lo, hi);
        cursor = hi;
    }

    if (cursor < end)
        xs.emplace_back (cursor, end);

    return xs;
}

//
// `offsets' maps the operator's text to its normalized text, which the
// slices cover:
//
void
append_match_segments (replacement_segments_t& segments,
                       const operator_record_t& record,
                       const std::wstring& text,
                       const std::vector< size_t >& offsets,
                       const span_slices_t& slices,
                       size_t start, size_t end) {
    const auto literals = literal_ranges_of (record);

    auto groups = group_by_span (slices);

    if (groups.empty ())
        groups.emplace_back ();

    size_t cursor = start, base = offsets [start];

    for (size_t i = 0; i < groups.size () && cursor < end; ++i) {
        const auto& group = groups [i];
        const auto lo = cursor, next = base + length_of (group);

        //
        // The last group takes whatever is left of the operator's range, the
        // others end at the first character past their normalized length:
        //
        auto hi = end;

        if (i + 1 < groups.size ()) {
            hi = size_t (std::lower_bound (
                             offsets.begin () + lo, offsets.begin () + end,
                             next) - offsets.begin ());
        }

        for (const auto& [a, b] : split_by_literals (literals, lo, hi)) {
            segments.push_back (make_segment (
                record, text, segment_role_t::match, a, b,
                slice_span_slices (
                    group, offsets [a] - base, offsets [b] - base)));
        }

        cursor = hi;
        base = next;
    }
}

bool
is_whole_literal (const operator_record_t& record, size_t start, size_t end) {
    const auto literals = literal_ranges_of (record);

    return literals.end () != find_if (literals, [&](const auto& x) {
        return x.start == start && x.end == end;
    });
}

void
allocate (replacement_plan_t& plan, const operator_records_t& records) {
    std::vector< replacement_segment_t* > matches;

    for (auto& segment : plan.segments)
        if (segment.role == segment_role_t::match)
            matches.push_back (&segment);

    std::vector< size_t > lengths;

    for (const auto* p : matches)
        lengths.push_back (p->local_end - p->local_start);

    const auto pieces = allocate_replacement (plan.replacement_text, lengths);

    size_t cursor = 0;

    for (size_t i = 0; i < matches.size (); ++i) {
        auto& segment = *matches [i];

        segment.planned_text = pieces [i];

        segment.replacement_start = cursor;
        segment.replacement_end = cursor += pieces [i].size ();

        if (!segment.planned_text.empty ())
            continue;

        const auto& record = records [segment.operator_index];

        if (record.literal_kind == literal_kind_t::array &&
            is_whole_literal (record, segment.local_start, segment.local_end)) {
            segment.requires_isolation = true;
        }
        else if (0 < i && i + 1 < matches.size ()) {
            error (errSyntaxWarning, off_t (segment.operator_index),
                   "Operator {}: empty replacement for [{}, {}) is left as "
                   "an empty string", segment.operator_index,
                   segment.local_start, segment.local_end);
        }
    }
}

} // anonymous

replacement_plan_t
build_replacement_plan (size_t page,
                        const std::wstring& target,
                        const std::wstring& replacement,
                        const operator_records_t& records,
                        const alignment_t& alignment,
                        const std::vector< match_strategy_t >& strategies) {
    if (target.empty ())
        throw match_not_found_error ("empty target text");

    struct extent_t {
        size_t start, end;
        const operator_record_t* record;
    };

    std::wstring text;
    std::vector< extent_t > extents;

    for (const auto& record : records) {
        const auto s = record.text ();

        if (s.empty ())
            continue;

        extents.push_back ({ text.size (), text.size () + s.size (), &record });
        text += s;
    }

    std::optional< match_range_t > range;

    for (const auto& strategy : strategies)
        if ((range = strategy (text, target)))
            break;

    if (!range) {
        throw match_not_found_error (
            "text not found on page " + std::to_string (page) + ": " +
            to_utf8 (target));
    }

    replacement_plan_t plan{
        page, text.substr (range->start, range->end - range->start),
        replacement };

    static const span_slices_t none;

    for (const auto& x : extents) {
        const auto lo = (std::max) (range->start, x.start);
        const auto hi = (std::min) (range->end, x.end);

        if (hi <= lo)
            continue;

        const auto& record = *x.record;
        const auto s = record.text ();

        auto iter = alignment.find (record.index);
        const auto& slices = iter == alignment.end () ? none : iter->second;

        const auto start = lo - x.start, end = hi - x.start;

        //
        // The aligned slices cover the normalized text, where ligatures are
        // expanded and white-space runs collapsed:
        //
        std::vector< size_t > offsets;
        normalize_text (s, offsets);

        auto slice = [&](size_t a, size_t b) {
            return slice_span_slices (slices, offsets [a], offsets [b]);
        };

        if (start > 0) {
            plan.segments.push_back (make_segment (
                record, s, segment_role_t::prefix, 0, start,
                slice (0, start)));
        }

        append_match_segments (
            plan.segments, record, s, offsets, slice (start, end), start, end);

        if (end < s.size ()) {
            plan.segments.push_back (make_segment (
                record, s, segment_role_t::suffix, end, s.size (),
                slice (end, s.size ())));
        }
    }

    allocate (plan, records);

    return plan;
}

} // namespace respan
