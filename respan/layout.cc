// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <respan/Error.hh>
#include <respan/layout.hh>

#include <utils/string.hh>

namespace respan {
namespace {

using tokens_t = std::vector< std::string >;

bool to_double (const std::string& s, double& value) {
    char* end = 0;
    value = std::strtod (s.c_str (), &end);
    return !s.empty () && !*end;
}

//
// Parses n reals, starting at tokens [i]:
//
bool
reals (const tokens_t& tokens, size_t i, size_t n, double* values) {
    if (tokens.size () < i + n)
        return false;

    for (size_t j = 0; j < n; ++j) {
        if (!to_double (tokens [i + j], values [j]))
            return false;
    }

    return true;
}

bool parse_span (const tokens_t& tokens, layout_span_t& span) {
    double xs [6];

    if (tokens.size () < 7 || !reals (tokens, 2, 5, xs))
        return false;

    span.font = tokens [1];
    span.size = xs [0];
    span.bbox = normalize (bbox_t{ xs [1], xs [2], xs [3], xs [4] });

    for (size_t i = 7; i < tokens.size ();) {
        const auto& key = tokens [i];

        if (key == "origin" && reals (tokens, i + 1, 2, xs)) {
            span.origin = point_t{ xs [0], xs [1] };
            i += 3;
        }
        else if (key == "dir" && reals (tokens, i + 1, 2, xs)) {
            span.direction = point_t{ xs [0], xs [1] };
            i += 3;
        }
        else if (key == "ascent" && reals (tokens, i + 1, 1, xs)) {
            span.ascent = xs [0];
            i += 2;
        }
        else if (key == "descent" && reals (tokens, i + 1, 1, xs)) {
            span.descent = xs [0];
            i += 2;
        }
        else if (key == "matrix" && reals (tokens, i + 1, 6, xs)) {
            span.matrix = matrix_t{ xs [0], xs [1], xs [2], xs [3], xs [4], xs [5] };
            i += 7;
        }
        else {
            return false;
        }
    }

    return true;
}

bool parse_char (const tokens_t& tokens, layout_char_t& ch) {
    if (tokens.size () < 2)
        return false;

    auto code = tokens [1];

    if (code.size () > 2 && (code [0] == 'U' || code [0] == 'u') &&
        code [1] == '+') {
        code = code.substr (2);
    }

    char* end = 0;
    const auto value = std::strtoul (code.c_str (), &end, 16);

    if (code.empty () || *end || value > 0x10FFFF)
        return false;

    ch.c = wchar_t (value);

    size_t i = 2;

    double xs [4];

    if (reals (tokens, 2, 4, xs)) {
        ch.box = normalize (bbox_t{ xs [0], xs [1], xs [2], xs [3] });
        i += 4;
    }

    if (i < tokens.size () && tokens [i] == "synthetic") {
        ch.synthetic = true;
        ++i;
    }

    return i == tokens.size ();
}

} // anonymous

page_layout_t read_page_layout (std::istream& stream) {
    page_layout_t page;

    auto line_of = [&]() -> layout_line_t& {
        if (page.blocks.empty ())
            page.blocks.emplace_back ();

        auto& block = page.blocks.back ();

        if (block.lines.empty ())
            block.lines.emplace_back ();

        return block.lines.back ();
    };

    std::string buf;

    for (int lineno = 1; std::getline (stream, buf); ++lineno) {
        const auto tokens = tokenize (buf);

        if (tokens.empty () || tokens [0][0] == '#')
            continue;

        const auto& cmd = tokens [0];

        bool ok = true;

        if (cmd == "page") {
            double xs [2];

            if (tokens.size () >= 2 && tokens [1].find_first_not_of (
                    "0123456789") == std::string::npos) {
                page.index = std::strtoul (tokens [1].c_str (), 0, 10);

                if (tokens.size () == 4 && reals (tokens, 2, 2, xs)) {
                    page.width = xs [0];
                    page.height = xs [1];
                }
                else {
                    ok = tokens.size () == 2;
                }
            }
            else {
                ok = false;
            }
        }
        else if (cmd == "block") {
            page.blocks.emplace_back ();
        }
        else if (cmd == "line") {
            if (page.blocks.empty ())
                page.blocks.emplace_back ();

            page.blocks.back ().lines.emplace_back ();
        }
        else if (cmd == "span") {
            layout_span_t span;

            if ((ok = parse_span (tokens, span)))
                line_of ().spans.push_back (std::move (span));
        }
        else if (cmd == "char") {
            layout_char_t ch;

            auto& line = line_of ();

            if (line.spans.empty ()) {
                error (errSyntaxWarning, lineno,
                       "Layout character outside of a span");
                continue;
            }

            if ((ok = parse_char (tokens, ch)))
                line.spans.back ().chars.push_back (ch);
        }
        else {
            ok = false;
        }

        if (!ok) {
            error (errSyntaxWarning, lineno, "Bad '{}' layout record", cmd);
        }
    }

    return page;
}

page_layout_t read_page_layout (const fs::path& path) {
    std::ifstream stream (path);

    if (!stream) {
        error (errIO, -1, "Couldn't open layout file '{}'", path.string ());
        throw std::runtime_error ("couldn't open layout file");
    }

    return read_page_layout (stream);
}

} // namespace respan
