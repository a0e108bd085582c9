// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_ALIGNMENT_HH
#define RESPAN_RESPAN_ALIGNMENT_HH

#include <defs.hh>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <respan/span.hh>
#include <respan/tracker.hh>

namespace respan {

//
// Operator index to the span slices which render its text:
//
using alignment_t = std::map< size_t, span_slices_t >;

//
// Locates the text of each operator, in document order, in the concatenated
// normalized text of the spans. The search never goes back before the end of
// the previous match. Texts of at least `min_length' characters which are
// not found whole are retried with shorter and shorter prefixes, down to
// `min_length' characters. Operators not found are left out.
//
alignment_t
align_records_to_spans (const operator_records_t&,
                        const std::vector< span_record_ptr >&,
                        size_t min_length = RESPAN_ALIGN_MIN_LENGTH);

//
// Position and length of the longest prefix of `target', not shorter than
// `min_length', found in `text' at or after `pos':
//
std::optional< std::pair< size_t, size_t > >
find_partial_match (const std::wstring& text, const std::wstring& target,
                    size_t pos, size_t min_length = RESPAN_ALIGN_MIN_LENGTH);

} // namespace respan

#endif // RESPAN_RESPAN_ALIGNMENT_HH
