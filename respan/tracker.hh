// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_TRACKER_HH
#define RESPAN_RESPAN_TRACKER_HH

#include <defs.hh>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <respan/bbox.hh>
#include <respan/content_stream.hh>
#include <respan/matrix.hh>

namespace respan {

//
// Graphics and text state relevant to text placement:
//
struct text_state_t {
    matrix_t ctm, text_matrix, line_matrix;

    std::optional< std::string > font;
    double font_size = 12;

    double char_spacing = 0, word_spacing = 0, horizontal_scaling = 100;
    double leading = 0, rise = 0;
};

//
// How a text-show operator carries its string(s): a single literal, a single
// hexadecimal string, or a TJ array.
//
enum struct literal_kind_t { none, text, byte, array };

//
// The kind of each item of a text-show operand list, in order:
//
enum struct operand_kind_t { text, byte, number };

const char* name_of (literal_kind_t);

//
// Advance measured along the writing direction:
//
struct advance_metrics_t {
    double advance;
    double start, end;
    point_t direction;
};

struct operator_record_t {
    size_t index;

    std::string name;
    std::vector< parser::ast::obj_t > operands;

    size_t graphics_depth, text_depth;

    //
    // State in effect when the operator executes:
    //
    text_state_t state;

    //
    // Decoded payload of text-show operators:
    //
    std::vector< std::wstring > fragments;
    std::vector< double > adjustments;
    std::vector< operand_kind_t > operand_kinds;
    std::vector< std::string > raw;

    literal_kind_t literal_kind = literal_kind_t::none;

    std::optional< double > advance;
    std::optional< matrix_t > post_text_matrix;

    //
    // Drift diagnostics, filled in by page analysis:
    //
    std::optional< advance_metrics_t > metrics;
    std::optional< point_t > world_start, world_end;
    std::optional< double > drift;

    std::vector< std::string > warnings;

    std::wstring text () const;

    bool has_text () const;

    bool is_text_show () const;
};

using operator_records_t = std::vector< operator_record_t >;

//
// Decodes one PDF string into text: UTF-16BE when it starts with a byte
// order mark, bytes as Latin-1 otherwise.
//
std::wstring decode_pdf_string (const std::string&);

//
// Inverse of the above, for the given kind; characters which do not fit a
// byte force UTF-16BE for text strings.
//
std::string
encode_pdf_string (const std::wstring&, operand_kind_t, bool utf16 = false);

inline bool is_utf16 (const std::string& s) {
    return s.size () >= 2 && s [0] == '\xFE' && s [1] == '\xFF';
}

//
// Supplies the advance of a text-show operator, in unscaled text space units,
// or nothing to fall back on the naive estimate:
//
using advance_resolver_t = std::function<
    std::optional< double > (const operator_record_t&, const text_state_t&) >;

//
// Replays a content stream, snapshotting the text state at each operator.
//
class content_state_tracker_t {
public:
    explicit content_state_tracker_t (
        advance_resolver_t = { },
        double glyph_width = RESPAN_NAIVE_GLYPH_WIDTH);

    operator_records_t walk (const operators_t&) const;

    //
    // Estimate from the font size and the spacing parameters alone:
    //
    double naive_advance (const operator_record_t&, const text_state_t&) const;

private:
    std::optional< double >
    resolve_advance (const operator_record_t&, const text_state_t&) const;

private:
    advance_resolver_t resolver_;
    double glyph_width_;
};

} // namespace respan

#endif // RESPAN_RESPAN_TRACKER_HH
