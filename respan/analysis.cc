// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cmath>

#include <respan/Error.hh>
#include <respan/analysis.hh>
#include <respan/metrics.hh>

#include <fmt/format.h>

namespace respan {

namespace {

void
warn (operator_record_t& record, const std::string& s) {
    error (errSyntaxWarning, off_t (record.index), "{} at operator {} ({})",
           s, record.index, record.name);

    record.warnings.push_back (s);
}

void
check_drift (operator_record_t& record, const advance_metrics_t& metrics,
             double tolerance) {
    const auto& state = record.state;

    const auto start = translation_of (state.ctm * state.text_matrix);
    const auto end = translation_of (
        state.ctm * record.post_text_matrix.value_or (state.text_matrix));

    record.metrics = metrics;

    record.world_start = start;
    record.world_end = end;

    const auto dx = end.x - start.x - metrics.direction.x * metrics.advance;
    const auto dy = end.y - start.y - metrics.direction.y * metrics.advance;

    record.drift = std::hypot (dx, dy);

    if (*record.drift > tolerance) {
        warn (record, fmt::format (
                  "suffix matrix drift {:.3f}pt exceeds tolerance",
                  *record.drift));
    }
}

} // anonymous

page_analysis_t
analyze_page (const operators_t& ops, const page_layout_t& layout,
              const params_t& params) {
    page_analysis_t analysis{ layout.index };

    const auto preliminary = content_state_tracker_t (
        { }, params.naive_glyph_width).walk (ops);

    analysis.spans = extract_spans (layout);
    analysis.alignment = align_records_to_spans (
        preliminary, analysis.spans, params.align_min_length);

    std::map< size_t, advance_metrics_t > advances;

    for (const auto& record : preliminary) {
        std::optional< advance_metrics_t > metrics;

        auto iter = analysis.alignment.find (record.index);

        if (iter != analysis.alignment.end ())
            metrics = compute_advance (iter->second);

        if (!metrics)
            metrics = fallback_metrics (record);

        if (metrics)
            advances.emplace (record.index, *metrics);
    }

    auto resolver = [&](const operator_record_t& record, const text_state_t&)
        -> std::optional< double > {
        auto iter = advances.find (record.index);

        if (iter == advances.end ())
            return { };

        return iter->second.advance;
    };

    analysis.records = content_state_tracker_t (
        resolver, params.naive_glyph_width).walk (ops);

    if (analysis.spans.empty ()) {
        error (errSyntaxWarning, -1,
               "Page {}: span extraction unavailable; using naive advance",
               layout.index);

        analysis.warnings.push_back ("span extraction unavailable");
        return analysis;
    }

    for (auto& record : analysis.records) {
        if (record.has_text () && !analysis.alignment.count (record.index))
            warn (record, "missing span alignment; using naive advance");

        auto iter = advances.find (record.index);

        if (iter != advances.end ()) {
            record.advance = iter->second.advance;
            check_drift (record, iter->second, params.drift_tolerance);
        }
    }

    return analysis;
}

} // namespace respan
