// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <tuple>

#include <respan/alignment.hh>
#include <respan/normalize.hh>

namespace respan {

namespace {

//
// Offset of each span in the concatenated text:
//
struct span_extent_t {
    size_t start, end;
    span_record_ptr span;
};

span_slices_t
collect_slices (const std::vector< span_extent_t >& extents,
                size_t start, size_t end) {
    span_slices_t slices;

    for (const auto& x : extents) {
        if (x.end <= start)
            continue;

        if (x.start >= end)
            break;

        const auto [first, last] = adjust_to_graphemes (
            *x.span,
            (std::max) (start, x.start) - x.start,
            (std::min) (end, x.end) - x.start);

        if (last > first)
            slices.push_back ({ x.span, first, last });

        if (x.end >= end)
            break;
    }

    return slices;
}

} // anonymous

std::optional< std::pair< size_t, size_t > >
find_partial_match (const std::wstring& text, const std::wstring& target,
                    size_t pos, size_t min_length) {
    if (0 == min_length || target.size () < min_length)
        return { };

    for (size_t n = target.size (); n >= min_length; --n) {
        const auto off = text.find (target.data (), pos, n);

        if (off != std::wstring::npos)
            return std::make_pair (off, n);
    }

    return { };
}

alignment_t
align_records_to_spans (const operator_records_t& records,
                        const std::vector< span_record_ptr >& spans,
                        size_t min_length) {
    alignment_t alignment;

    if (records.empty () || spans.empty ())
        return alignment;

    std::wstring text;
    std::vector< span_extent_t > extents;

    for (const auto& span : spans) {
        const auto start = text.size ();
        text += span->normalized_text;
        extents.push_back ({ start, text.size (), span });
    }

    size_t pos = 0;

    for (const auto& record : records) {
        const auto target = normalize_text (record.text ());

        if (target.empty ())
            continue;

        size_t off = text.find (target, pos), n = target.size ();

        if (off == std::wstring::npos) {
            const auto partial = find_partial_match (
                text, target, pos, min_length);

            if (!partial)
                continue;

            std::tie (off, n) = *partial;
        }

        auto slices = collect_slices (extents, off, off + n);

        if (!slices.empty ()) {
            alignment.emplace (record.index, std::move (slices));
            pos = off + n;
        }
    }

    return alignment;
}

} // namespace respan
