// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_ANALYSIS_HH
#define RESPAN_RESPAN_ANALYSIS_HH

#include <defs.hh>

#include <map>
#include <string>
#include <vector>

#include <respan/alignment.hh>
#include <respan/content_stream.hh>
#include <respan/layout.hh>
#include <respan/params.hh>
#include <respan/span.hh>
#include <respan/tracker.hh>

namespace respan {

struct page_analysis_t {
    size_t page;

    operator_records_t records;
    std::vector< span_record_ptr > spans;

    alignment_t alignment;

    //
    // Page-level diagnostics:
    //
    std::vector< std::string > warnings;
};

//
// Replays the content stream of a page twice, first to align operators to
// the rendered spans, then to apply the measured advances. Records whose
// end position drifts from the measured advance by more than the tolerance
// carry a warning.
//
page_analysis_t
analyze_page (const operators_t&, const page_layout_t&, const params_t&);

} // namespace respan

#endif // RESPAN_RESPAN_ANALYSIS_HH
