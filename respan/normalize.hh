// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_NORMALIZE_HH
#define RESPAN_RESPAN_NORMALIZE_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace respan {

//
// Joiners, zero-width spaces and the byte order mark:
//
bool is_zero_width (wchar_t);

//
// Combining marks attach to the preceding character:
//
bool is_combining (wchar_t);

//
// The multi-character form of a ligature, either a presentation form
// (U+FB00..U+FB06) or one of the control codes some TeX fonts place the
// f-ligatures at (0x0B..0x0F); null for other characters.
//
const wchar_t* ligature_expansion (wchar_t);

//
// Ligature expansion, minus zero-width characters:
//
std::wstring expand_text (const std::wstring&);

//
// Operator text as the aligner compares it: expanded, with white-space runs
// collapsed to a single space.
//
std::wstring normalize_text (const std::wstring&);

//
// As above; `offsets' receives, for each character of the argument and for
// its end, the offset in the normalized text. A character which produces no
// output maps to the offset of the next one which does.
//
std::wstring
normalize_text (const std::wstring&, std::vector< size_t >& offsets);

//
// Expanded, with all white-space removed; used to compare an expected and an
// observed run of text irrespective of spacing.
//
std::wstring compact_text (const std::wstring&);

} // namespace respan

#endif // RESPAN_RESPAN_NORMALIZE_HH
