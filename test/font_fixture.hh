// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_TEST_FONT_FIXTURE_HH
#define RESPAN_TEST_FONT_FIXTURE_HH

#include <defs.hh>

#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

#include <fofi/truetype.hh>

#include <utils/path.hh>

namespace respan::test {

using fofi::append_u16;
using fofi::append_u32;

//
// Glyphs of the test font:
//
enum : unsigned {
    notdef_gid, space_gid, a_gid, B_gid, o_gid, b_gid, c_gid, glyph_count
};

//
// A closed rectangle, as a simple glyph:
//
inline std::string
rectangle_glyph (int16_t x0, int16_t y0, int16_t x1, int16_t y1) {
    std::string s;

    append_u16 (s, 1);

    for (auto x : { x0, y0, x1, y1 })
        append_u16 (s, uint16_t (x));

    append_u16 (s, 3);
    append_u16 (s, 0);

    s.append (4, '\x01');

    for (auto x : { x0, int16_t (x1 - x0), int16_t (0), int16_t (x0 - x1) })
        append_u16 (s, uint16_t (x));

    for (auto x : { y0, int16_t (0), int16_t (y1 - y0), int16_t (0) })
        append_u16 (s, uint16_t (x));

    return s;
}

//
// A single component glyph drawing another one, unmoved:
//
inline std::string
component_glyph (unsigned gid, int16_t x0, int16_t y0, int16_t x1, int16_t y1) {
    std::string s;

    append_u16 (s, uint16_t (-1));

    for (auto x : { x0, y0, x1, y1 })
        append_u16 (s, uint16_t (x));

    append_u16 (s, 0x0003);
    append_u16 (s, uint16_t (gid));
    append_u16 (s, 0);
    append_u16 (s, 0);

    return s;
}

//
// Format 4 subtable of a Windows Unicode BMP character map, one segment per
// character:
//
inline std::string
cmap_table (const std::vector< std::tuple< uint16_t, uint16_t > >& xs) {
    std::string s;

    append_u16 (s, 0);
    append_u16 (s, 1);
    append_u16 (s, 3);
    append_u16 (s, 1);
    append_u32 (s, 12);

    const uint16_t n = xs.size () + 1;

    uint16_t search_range = 2, entry_selector = 0;

    for (; search_range * 2 <= 2 * n; search_range *= 2)
        ++entry_selector;

    append_u16 (s, 4);
    append_u16 (s, 16 + 8 * n);
    append_u16 (s, 0);
    append_u16 (s, 2 * n);
    append_u16 (s, search_range);
    append_u16 (s, entry_selector);
    append_u16 (s, 2 * n - search_range);

    for (const auto& [c, gid] : xs)
        append_u16 (s, c);

    append_u16 (s, 0xFFFF);
    append_u16 (s, 0);

    for (const auto& [c, gid] : xs)
        append_u16 (s, c);

    append_u16 (s, 0xFFFF);

    for (const auto& [c, gid] : xs)
        append_u16 (s, uint16_t (gid - c));

    append_u16 (s, 1);

    for (size_t i = 0; i < n; ++i)
        append_u16 (s, 0);

    return s;
}

//
// A 1000 units/em TrueType font mapping ` ', `B', `a', `b', `c' and `o';
// `c' is a composite of `o':
//
inline fofi::truetype_t make_test_font () {
    fofi::truetype_t font;

    std::string head (54, '\0');

    fofi::put_u32 (head,  0, 0x00010000);
    fofi::put_u32 (head,  4, 0x00010000);
    fofi::put_u32 (head, 12, 0x5F0F3CF5);
    fofi::put_u16 (head, 16, 0x0003);
    fofi::put_u16 (head, 18, 1000);
    fofi::put_u16 (head, 48, 2);

    font.set_table ("head", head);

    std::string hhea (36, '\0');

    fofi::put_u32 (hhea, 0, 0x00010000);
    fofi::put_u16 (hhea, 4, 800);
    fofi::put_u16 (hhea, 6, uint16_t (-200));
    fofi::put_u16 (hhea, 18, 1);

    font.set_table ("hhea", hhea);

    std::string maxp (32, '\0');

    fofi::put_u32 (maxp, 0, 0x00010000);
    fofi::put_u16 (maxp, 6, 4);
    fofi::put_u16 (maxp, 8, 1);
    fofi::put_u16 (maxp, 10, 4);
    fofi::put_u16 (maxp, 12, 1);
    fofi::put_u16 (maxp, 14, 2);
    fofi::put_u16 (maxp, 28, 1);
    fofi::put_u16 (maxp, 30, 1);

    font.set_table ("maxp", maxp);

    std::string post (32, '\0');
    fofi::put_u32 (post, 0, 0x00030000);

    font.set_table ("post", post);

    font.set_table ("cmap", cmap_table ({
                { 0x20, space_gid }, { 0x42, B_gid }, { 0x61, a_gid },
                { 0x62, b_gid }, { 0x63, c_gid }, { 0x6F, o_gid } }));

    font.set_glyphs ({
            std::string (),
            std::string (),
            rectangle_glyph (50, 0, 450, 500),
            rectangle_glyph (50, 0, 550, 700),
            rectangle_glyph (50, 0, 500, 500),
            rectangle_glyph (50, 0, 450, 700),
            component_glyph (o_gid, 50, 0, 500, 500) });

    font.set_hmetrics ({
            { 500, 0 }, { 250, 0 }, { 500, 50 }, { 600, 50 },
            { 550, 50 }, { 500, 50 }, { 550, 50 } });

    return font;
}

inline fs::path write_test_font (const fs::path& dir) {
    const auto path = dir / "TestSans.ttf";

    const auto bytes = make_test_font ().serialize ();
    std::ofstream (path, std::ios::binary).write (bytes.data (), bytes.size ());

    return path;
}

//
// A scratch directory, removed with its content at the end of the scope:
//
struct scratch_dir_t {
    scratch_dir_t () : path (make_temp_path ()) {
        fs::create_directories (path);
    }

    ~scratch_dir_t () {
        std::error_code ignore;
        fs::remove_all (path, ignore);
    }

    fs::path path;
};

} // namespace respan::test

#endif // RESPAN_TEST_FONT_FIXTURE_HH
