// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <string>

#include <attack/glyph_lookup.hh>
#include <fofi/truetype.hh>

#include <utils/string.hh>

#include <fmt/format.h>

#include FT_ADVANCES_H

namespace respan::attack {

namespace {

std::string describe (const std::vector< wchar_t >& xs) {
    std::string s = "characters missing from the baseline font:";

    for (auto c : xs)
        s += fmt::format (" '{}' (U+{:04X})", to_utf8 (c), unsigned (c));

    return s;
}

} // anonymous

glyph_lookup_error::glyph_lookup_error (std::vector< wchar_t > xs)
    : std::runtime_error (describe (xs)), missing (std::move (xs))
{ }

void glyph_lookup_t::ensure_available (const std::wstring& s) const {
    std::vector< wchar_t > xs;

    for (auto c : s) {
        if (!has (c) && xs.end () == std::find (xs.begin (), xs.end (), c))
            xs.push_back (c);
    }

    if (!xs.empty ())
        throw glyph_lookup_error (std::move (xs));
}

////////////////////////////////////////////////////////////////////////

ft_glyph_lookup_t::ft_glyph_lookup_t (const fs::path& filepath)
    : path_ (filepath) {
    if (FT_Init_FreeType (&library_))
        throw fofi::font_error ("cannot initialize FreeType");

    if (FT_New_Face (library_, filepath.c_str (), 0, &face_)) {
        FT_Done_FreeType (library_);
        throw fofi::font_error (filepath.string () + ": cannot open font");
    }
}

ft_glyph_lookup_t::~ft_glyph_lookup_t () {
    FT_Done_Face (face_);
    FT_Done_FreeType (library_);
}

unsigned ft_glyph_lookup_t::glyph_index (wchar_t c) const {
    return FT_Get_Char_Index (face_, FT_ULong (c));
}

std::string ft_glyph_lookup_t::glyph_name (wchar_t c) const {
    const auto gid = glyph_index (c);

    if (0 == gid)
        throw glyph_lookup_error ({ c });

    if (FT_HAS_GLYPH_NAMES (face_)) {
        char buf [128] = { 0 };

        if (0 == FT_Get_Glyph_Name (face_, gid, buf, sizeof buf) && buf [0])
            return buf;
    }

    return "gid" + std::to_string (gid);
}

double ft_glyph_lookup_t::glyph_width (wchar_t c) const {
    const auto gid = glyph_index (c);

    if (0 == gid)
        throw glyph_lookup_error ({ c });

    FT_Fixed advance = 0;

    if (FT_Get_Advance (face_, gid, FT_LOAD_NO_SCALE, &advance))
        throw fofi::font_error ("cannot read the advance of glyph " +
                                std::to_string (gid));

    return double (advance);
}

} // namespace respan::attack
