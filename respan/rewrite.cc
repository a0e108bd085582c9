// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <memory>
#include <string>
#include <stdexcept>

#include <respan/Error.hh>
#include <respan/normalize.hh>
#include <respan/rewrite.hh>

#include <utils/string.hh>

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/view/reverse.hpp>
using namespace ranges;

namespace respan {
namespace ast = parser::ast;

span_accumulator_t::span_accumulator_t (span_record_ptr span, double min_scale)
    : span_ (std::move (span)), min_scale_ (min_scale)
{ }

void
span_accumulator_t::add_replacement (
    size_t start, size_t end, std::wstring replacement, mapping_ref_t mapping,
    bool overlay_fallback) {
    if (end <= start)
        return;

    for (const auto& x : replacements_) {
        const bool covered = start <= x.start && x.end <= end;

        //
        // Contained in, or overlapping, a pending replacement:
        //
        if (!covered && start < x.end && x.start < end)
            return;
    }

    std::vector< slice_replacement_t > xs;

    for (auto& x : replacements_)
        if (!(start <= x.start && x.end <= end))
            xs.push_back (std::move (x));

    xs.push_back ({
            start, end, std::move (replacement), std::move (mapping),
            overlay_fallback });

    replacements_ = std::move (xs);
}

std::pair< size_t, size_t >
span_accumulator_t::raw_bounds (size_t start, size_t end) const {
    const auto& span = *span_;
    const auto& xs = span.normalized_to_raw;

    const auto n = span.text.size ();

    if (span.text.empty () || span.normalized_text.empty () ||
        xs.size () != span.normalized_text.size ())
        return { start, end };

    size_t lo, hi;

    if (0 == start)
        lo = 0;
    else if (start >= xs.size ())
        lo = n;
    else
        lo = xs [start].first;

    if (0 == end)
        hi = 0;
    else if (end > xs.size ())
        hi = xs.back ().second;
    else
        hi = xs [end - 1].second;

    lo = (std::min) (lo, n);
    hi = (std::max) (lo, (std::min) (hi, n));

    return { lo, hi };
}

std::optional< span_rewrite_entry_t >
span_accumulator_t::build_entry (size_t page, const width_measure_t& measure) {
    failures_.clear ();

    if (replacements_.empty ())
        return { };

    const auto& span = *span_;

    const auto& base = span.text.empty () ? span.normalized_text : span.text;

    if (base.empty ())
        return { };

    auto xs = replacements_;

    sort (xs, [](const auto& lhs, const auto& rhs) {
        return lhs.start < rhs.start;
    });

    std::vector< std::pair< size_t, size_t > > bounds;

    for (const auto& x : xs) {
        auto [lo, hi] = raw_bounds (x.start, x.end);

        lo = (std::min) (lo, base.size ());
        hi = (std::max) (lo, (std::min) (hi, base.size ()));

        const auto observed = base.substr (lo, hi - lo);

        if (!x.mapping.original.empty () &&
            compact_text (observed) != compact_text (x.mapping.original)) {
            error (errSyntaxWarning, -1,
                   "Span {}/{}/{}: expected '{}', found '{}' at [{}, {})",
                   span.block, span.line, span.span,
                   to_utf8 (x.mapping.original), to_utf8 (observed), lo, hi);

            failures_.push_back ({
                    x.mapping.original, observed, lo, hi, x.replacement,
                    x.mapping.operator_index });

            continue;
        }

        bounds.emplace_back (lo, hi);
    }

    if (!failures_.empty ())
        return { };

    span_rewrite_entry_t entry{
        page, span.block, span.line, span.span };

    entry.original_text = base;
    entry.replacement_text = base;

    for (size_t i = xs.size (); i; --i) {
        const auto [lo, hi] = bounds [i - 1];
        entry.replacement_text.replace (lo, hi - lo, xs [i - 1].replacement);
    }

    for (const auto& x : xs) {
        entry.mappings.push_back (x.mapping);

        if (!entry.operator_index)
            entry.operator_index = x.mapping.operator_index;
    }

    entry.font = span.font;
    entry.font_size = span.font_size;

    entry.bbox = span.bbox;
    entry.matrix = span.matrix;

    entry.original_width = width_of (span.bbox);
    entry.replacement_width = measure
        ? measure (entry.replacement_text, span.font, span.font_size) : 0.;

    entry.overlay_fallback = any_of (
        xs, [](const auto& x) { return x.overlay_fallback; });

    if (entry.replacement_width > 0 && entry.original_width > 0 &&
        entry.replacement_width > entry.original_width) {
        const auto scale = entry.original_width / entry.replacement_width;

        entry.scale = (std::max) (scale, min_scale_);
        entry.requires_scaling = true;

        //
        // Illegible when squeezed further:
        //
        if (scale < min_scale_)
            entry.overlay_fallback = true;
    }

    return entry;
}

void
accumulate_plan (span_accumulators_t& accumulators,
                 const replacement_plan_t& plan, double min_scale) {
    for (const auto& segment : plan.segments) {
        if (segment.role != segment_role_t::match || segment.slices.empty ())
            continue;

        std::vector< size_t > lengths;

        for (const auto& slice : segment.slices)
            lengths.push_back (slice.size ());

        const auto pieces = allocate_replacement (
            segment.planned_text, lengths);

        //
        // What each slice is expected to show, split like the replacement;
        // the accumulator checks it against the span:
        //
        const auto expected = allocate_replacement (
            normalize_text (segment.text), lengths);

        for (size_t i = 0; i < segment.slices.size (); ++i) {
            const auto& slice = segment.slices [i];
            const auto& span = *slice.span;

            const span_key_t key{ span.block, span.line, span.span };

            auto iter = accumulators.find (key);

            if (iter == accumulators.end ()) {
                iter = accumulators.emplace (
                    key, span_accumulator_t (slice.span, min_scale)).first;
            }

            mapping_ref_t mapping{
                expected [i], pieces [i], segment.operator_index };

            iter->second.add_replacement (
                slice.start, slice.end, pieces [i], std::move (mapping));
        }
    }
}

namespace {

ast::string_t
encode (const std::wstring& text, const ast::string_t& original) {
    return ast::string_t (
        encode_pdf_string (
            text, original.hex ? operand_kind_t::byte : operand_kind_t::text,
            is_utf16 (original)),
        original.hex);
}

//
// The string operands of a text-show operator, in order:
//
std::vector< const ast::string_t* >
strings_of (const parser::ast::operator_t& op) {
    std::vector< const ast::string_t* > xs;

    if (op.operands.empty ())
        return xs;

    if (op.name == "TJ") {
        const auto& x = op.operands.front ();

        if (std::holds_alternative< ast::array_pointer > (x)) {
            for (const auto& y : *std::get< ast::array_pointer > (x))
                if (std::holds_alternative< ast::string_t > (y))
                    xs.push_back (&std::get< ast::string_t > (y));
        }
    }
    else if (std::holds_alternative< ast::string_t > (op.operands.back ())) {
        xs.push_back (&std::get< ast::string_t > (op.operands.back ()));
    }

    return xs;
}

void
rewrite (operator_t& op, const operator_record_t& record,
         const std::vector< const replacement_segment_t* >& segments) {
    auto fragments = record.fragments;

    const auto n = fragments.size ();
    std::vector< bool > touched (n), dropped (n);

    std::vector< size_t > offsets (1, 0);

    for (const auto& s : record.fragments)
        offsets.push_back (offsets.back () + s.size ());

    for (const auto* p : segments | views::reverse) {
        const auto& segment = *p;

        size_t i = 0;

        for (; i < n; ++i)
            if (offsets [i] <= segment.local_start &&
                segment.local_end <= offsets [i + 1])
                break;

        if (i == n) {
            throw std::runtime_error (
                "operator " + std::to_string (record.index) +
                ": replacement crosses a string boundary");
        }

        if (segment.requires_isolation) {
            dropped [i] = true;
            continue;
        }

        fragments [i].replace (
            segment.local_start - offsets [i],
            segment.local_end - segment.local_start, segment.planned_text);

        touched [i] = true;
    }

    const auto strings = strings_of (op);

    if (strings.size () != n) {
        throw std::runtime_error (
            "operator " + std::to_string (record.index) +
            ": operands do not match the recorded strings");
    }

    if (op.name != "TJ") {
        if (touched [0])
            op.operands.back () = encode (fragments [0], *strings [0]);

        return;
    }

    ast::array_t arr;

    size_t i = 0;

    for (const auto& x : *std::get< ast::array_pointer > (op.operands [0])) {
        if (!std::holds_alternative< ast::string_t > (x)) {
            arr.push_back (x);
            continue;
        }

        if (!dropped [i]) {
            if (touched [i])
                arr.push_back (encode (fragments [i], *strings [i]));
            else
                arr.push_back (x);
        }

        ++i;
    }

    op.operands [0] = std::make_shared< ast::array_t > (std::move (arr));
}

} // anonymous

operators_t
apply_plan (const operators_t& ops, const operator_records_t& records,
            const replacement_plan_t& plan) {
    std::map< size_t, std::vector< const replacement_segment_t* > > xs;

    for (const auto& segment : plan.segments)
        if (segment.role == segment_role_t::match)
            xs [segment.operator_index].push_back (&segment);

    auto result = ops;

    for (const auto& [index, segments] : xs) {
        if (index >= result.size () || index >= records.size ()) {
            throw std::runtime_error (
                "operator " + std::to_string (index) + " is out of range");
        }

        rewrite (result [index], records [index], segments);
    }

    return result;
}

} // namespace respan
