// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <stdexcept>

#include <respan/Error.hh>
#include <respan/normalize.hh>
#include <respan/tracker.hh>

#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
using namespace ranges;

namespace respan {
namespace ast = parser::ast;

const char* name_of (literal_kind_t kind) {
    static const char* arr [] = { "none", "text", "byte", "array" };
    return arr [size_t (kind)];
}

std::wstring operator_record_t::text () const {
    std::wstring s;

    for (const auto& x : fragments)
        s += x;

    return s;
}

bool operator_record_t::has_text () const {
    for (const auto& x : fragments)
        if (!x.empty ())
            return true;

    return false;
}

bool operator_record_t::is_text_show () const {
    return name == "Tj" || name == "TJ" || name == "'" || name == "\"";
}

std::wstring decode_pdf_string (const std::string& s) {
    std::wstring result;

    if (is_utf16 (s)) {
        for (size_t i = 2; i + 1 < s.size (); i += 2) {
            unsigned c =
                (unsigned char)s [i] << 8 | (unsigned char)s [i + 1];

            //
            // Surrogate pairs:
            //
            if (0xD800 <= c && c < 0xDC00 && i + 3 < s.size ()) {
                const unsigned d =
                    (unsigned char)s [i + 2] << 8 | (unsigned char)s [i + 3];

                if (0xDC00 <= d && d < 0xE000) {
                    c = 0x10000 + ((c - 0xD800) << 10) + (d - 0xDC00);
                    i += 2;
                }
            }

            result += wchar_t (c);
        }
    }
    else {
        for (unsigned char c : s)
            result += wchar_t (c);
    }

    return result;
}

std::string
encode_pdf_string (const std::wstring& s, operand_kind_t kind, bool utf16) {
    if (kind == operand_kind_t::text && !utf16) {
        utf16 = std::any_of (
            s.begin (), s.end (), [](auto c) { return c > 0xFF; });
    }

    std::string result;

    if (utf16) {
        result = "\xFE\xFF";

        auto put = [&](unsigned c) {
            result += char (c >> 8);
            result += char (c & 0xFF);
        };

        for (auto c : s) {
            unsigned u = c;

            if (u >= 0x10000) {
                u -= 0x10000;
                put (0xD800 + (u >> 10));
                put (0xDC00 + (u & 0x3FF));
            }
            else {
                put (u);
            }
        }

        return result;
    }

    for (auto c : s) {
        if (c > 0xFF) {
            error (errSyntaxWarning, -1,
                   "Character U+{:04X} does not fit a byte string",
                   unsigned (c));
            result += '?';
        }
        else {
            result += char (c);
        }
    }

    return result;
}

namespace {

//
// Operands, as reals, zero-padded to the given arity:
//
std::vector< double >
numbers_of (const std::vector< ast::obj_t >& operands, size_t n) {
    std::vector< double > xs (n, 0.);

    for (size_t i = 0; i < n && i < operands.size (); ++i)
        xs [i] = ast::as_number (operands [i]);

    return xs;
}

matrix_t matrix_of (const std::vector< ast::obj_t >& operands) {
    const auto xs = numbers_of (operands, 6);
    return { xs [0], xs [1], xs [2], xs [3], xs [4], xs [5] };
}

double
number_of (const std::vector< ast::obj_t >& operands, size_t i, double value) {
    return i < operands.size () ? ast::as_number (operands [i], value) : value;
}

void next_line (text_state_t& state, double tx, double ty) {
    state.text_matrix = state.line_matrix = translate (
        state.line_matrix, tx, ty);
}

void
decode_string (const ast::string_t& s, operator_record_t& record,
               literal_kind_t& kind) {
    record.fragments.push_back (decode_pdf_string (s));
    record.raw.push_back (s);

    if (s.hex) {
        record.operand_kinds.push_back (operand_kind_t::byte);
        kind = literal_kind_t::byte;
    }
    else {
        record.operand_kinds.push_back (operand_kind_t::text);
        kind = literal_kind_t::text;
    }
}

void capture_text (operator_record_t& record) {
    const auto& operands = record.operands;

    if (operands.empty ())
        return;

    if (record.name == "TJ") {
        literal_kind_t ignore;

        if (std::holds_alternative< ast::array_pointer > (operands [0])) {
            for (const auto& x : *std::get< ast::array_pointer > (operands [0])) {
                if (std::holds_alternative< ast::string_t > (x)) {
                    decode_string (std::get< ast::string_t > (x), record, ignore);
                }
                else if (ast::is_number (x)) {
                    record.adjustments.push_back (ast::as_number (x));
                    record.operand_kinds.push_back (operand_kind_t::number);
                }
            }
        }

        record.literal_kind = literal_kind_t::array;
    }
    else {
        //
        // Tj, ' and " carry their string last:
        //
        const auto& x = operands.back ();

        if (std::holds_alternative< ast::string_t > (x)) {
            decode_string (
                std::get< ast::string_t > (x), record, record.literal_kind);
        }
    }
}

} // anonymous

content_state_tracker_t::content_state_tracker_t (
    advance_resolver_t resolver, double glyph_width)
    : resolver_ (std::move (resolver)), glyph_width_ (glyph_width)
{ }

double
content_state_tracker_t::naive_advance (
    const operator_record_t& record, const text_state_t& state) const {
    const auto text = record.text ();

    const auto n = count_if (text, [](auto c) { return !is_zero_width (c); });

    if (0 == n)
        return 0;

    const double scale = state.horizontal_scaling
        ? state.horizontal_scaling / 100. : 1.;

    const double spaces = count (text, L' ');

    const auto adjustment = accumulate (record.adjustments, 0.);

    return
        n * state.font_size * glyph_width_ * scale +
        state.char_spacing * (n - 1) * scale +
        state.word_spacing * spaces * scale -
        adjustment / 1000. * state.font_size * scale;
}

std::optional< double >
content_state_tracker_t::resolve_advance (
    const operator_record_t& record, const text_state_t& state) const {
    if (!record.has_text () && record.adjustments.empty ())
        return 0.;

    std::optional< double > advance;

    if (resolver_) {
        try {
            advance = resolver_ (record, state);
        }
        catch (const std::exception& e) {
            error (errSyntaxWarning, off_t (record.index),
                   "Advance resolver failed: {}; using naive advance",
                   e.what ());
        }
    }

    if (!advance)
        advance = naive_advance (record, state);

    return advance;
}

operator_records_t
content_state_tracker_t::walk (const operators_t& ops) const {
    operator_records_t records;
    records.reserve (ops.size ());

    std::vector< text_state_t > stack (1);

    size_t graphics_depth = 0, text_depth = 0;
    bool inside_text = false;

    for (size_t index = 0; index < ops.size (); ++index) {
        const auto& op = ops [index];
        const auto& operands = op.operands;

        auto& state = stack.back ();

        const bool shows_text = inside_text && (
            op.name == "Tj" || op.name == "TJ" ||
            op.name == "'"  || op.name == "\"");

        //
        // The show-and-advance variants move to the next line before
        // painting:
        //
        if (inside_text && op.name == "'") {
            next_line (state, 0, -state.leading);
        }
        else if (inside_text && op.name == "\"") {
            state.word_spacing = number_of (operands, 0, state.word_spacing);
            state.char_spacing = number_of (operands, 1, state.char_spacing);
            next_line (state, 0, -state.leading);
        }

        operator_record_t record{ };

        record.index = index;
        record.name = op.name;
        record.operands = operands;
        record.graphics_depth = graphics_depth;
        record.text_depth = text_depth;
        record.state = state;

        if (shows_text)
            capture_text (record);

        if (op.name == "q") {
            ++graphics_depth;
            stack.push_back (state);
        }
        else if (op.name == "Q") {
            if (graphics_depth > 0 && stack.size () > 1) {
                --graphics_depth;
                stack.pop_back ();

                if (inside_text) {
                    inside_text = false;
                    text_depth = text_depth ? text_depth - 1 : 0;
                }
            }
        }
        else if (op.name == "cm") {
            state.ctm = state.ctm * matrix_of (operands);
        }
        else if (op.name == "BT") {
            inside_text = true;
            ++text_depth;

            state.text_matrix = state.line_matrix = identity_matrix ();
            state.char_spacing = state.word_spacing = state.rise = 0;
            state.horizontal_scaling = 100;
        }
        else if (op.name == "ET") {
            inside_text = false;
            text_depth = text_depth ? text_depth - 1 : 0;
        }
        else if (op.name == "Tf") {
            if (!operands.empty () &&
                std::holds_alternative< ast::name_t > (operands [0])) {
                state.font = std::get< ast::name_t > (operands [0]);
            }

            state.font_size = number_of (operands, 1, state.font_size);
        }
        else if (op.name == "Tc") {
            state.char_spacing = number_of (operands, 0, 0);
        }
        else if (op.name == "Tw") {
            state.word_spacing = number_of (operands, 0, 0);
        }
        else if (op.name == "Tz") {
            state.horizontal_scaling = number_of (operands, 0, 100);
        }
        else if (op.name == "TL") {
            state.leading = number_of (operands, 0, 0);
        }
        else if (op.name == "Ts") {
            state.rise = number_of (operands, 0, 0);
        }
        else if (inside_text && op.name == "Tm") {
            state.text_matrix = state.line_matrix = matrix_of (operands);
        }
        else if (inside_text && (op.name == "Td" || op.name == "TD")) {
            const auto xs = numbers_of (operands, 2);

            next_line (state, xs [0], xs [1]);

            if (op.name == "TD")
                state.leading = -xs [1];
        }
        else if (inside_text && op.name == "T*") {
            next_line (state, 0, -state.leading);
        }

        if (shows_text) {
            if (const auto advance = resolve_advance (record, state)) {
                record.advance = *advance;

                state.text_matrix = state.line_matrix = translate (
                    state.text_matrix, *advance, 0);

                record.post_text_matrix = state.text_matrix;
            }
        }

        records.push_back (std::move (record));
    }

    return records;
}

} // namespace respan
