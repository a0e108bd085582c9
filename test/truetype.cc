// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE respan

#include <defs.hh>

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <fofi/truetype.hh>

#include <test/font_fixture.hh>

using namespace respan;
using namespace respan::fofi;

BOOST_AUTO_TEST_SUITE(truetype)

BOOST_AUTO_TEST_CASE(accessors) {
    std::string s ("\x01\x02\x03\x04\xFF\xFE", 6);

    BOOST_TEST (get_u16 (s, 0) == 0x0102U);
    BOOST_TEST (get_u32 (s, 0) == 0x01020304U);
    BOOST_TEST (get_s16 (s, 4) == -2);

    BOOST_CHECK_THROW (get_u16 (s, 5), font_error);
    BOOST_CHECK_THROW (get_u32 (s, 3), font_error);
    BOOST_CHECK_THROW (put_u16 (s, 6, 0), font_error);

    put_u16 (s, 4, 0xABCD);
    BOOST_TEST (get_u16 (s, 4) == 0xABCDU);

    append_u32 (s, 0xDEADBEEF);
    BOOST_TEST (s.size () == 10U);
    BOOST_TEST (get_u32 (s, 6) == 0xDEADBEEFU);
}

BOOST_AUTO_TEST_CASE(checksum) {
    BOOST_TEST (checksum_of ("\x00\x00\x00\x01\x00\x00\x00\x02", 8) == 3U);

    //
    // Trailing bytes are zero-padded:
    //
    BOOST_TEST (checksum_of ("\x01", 1) == 0x01000000U);
}

BOOST_AUTO_TEST_CASE(round_trip) {
    const auto bytes = test::make_test_font ().serialize ();

    BOOST_TEST (bytes.size () % 4 == 0U);

    //
    // The adjustment makes the whole file sum to the magic number:
    //
    BOOST_TEST (checksum_of (bytes.data (), bytes.size ()) == 0xB1B0AFBAU);

    const auto font = truetype_t::parse (bytes.data (), bytes.size ());

    BOOST_TEST (font.units_per_em () == 1000U);
    BOOST_TEST (font.num_glyphs () == unsigned (test::glyph_count));

    for (const char* tag : { "cmap", "glyf", "head", "hhea", "hmtx", "loca",
                             "maxp", "post" })
        BOOST_TEST (font.has (tag));

    const auto glyphs = font.glyphs ();

    BOOST_TEST_REQUIRE (glyphs.size () == size_t (test::glyph_count));
    BOOST_TEST (glyphs [test::space_gid].empty ());

    //
    // Glyph data is padded to a 4-byte boundary:
    //
    BOOST_TEST (glyphs [test::a_gid].size () == 36U);
    BOOST_TEST (
        glyphs [test::a_gid].substr (0, 34) == test::rectangle_glyph (50, 0, 450, 500));

    const auto metrics = font.hmetrics ();

    BOOST_TEST_REQUIRE (metrics.size () == size_t (test::glyph_count));
    BOOST_TEST (metrics [test::B_gid].advance == 600U);
    BOOST_TEST (metrics [test::B_gid].lsb == 50);

    //
    // Font bounding box, the union of the glyph boxes:
    //
    BOOST_TEST (get_s16 (font.table ("head"), 36) == 50);
    BOOST_TEST (get_s16 (font.table ("head"), 42) == 700);

    BOOST_TEST (get_u16 (font.table ("hhea"), 10) == 600U);
}

BOOST_AUTO_TEST_CASE(table_directory) {
    const auto bytes = test::make_test_font ().serialize ();

    const auto n = get_u16 (bytes, 4);

    BOOST_TEST (n == 8U);
    BOOST_TEST (get_u16 (bytes, 6) == 128U);
    BOOST_TEST (get_u16 (bytes, 8) == 3U);
    BOOST_TEST (get_u16 (bytes, 10) == 0U);

    std::string previous;

    for (size_t i = 0; i < n; ++i) {
        const auto off = 12 + 16 * i;
        const auto tag = bytes.substr (off, 4);

        BOOST_TEST (previous < tag);
        previous = tag;

        auto data = bytes.substr (get_u32 (bytes, off + 8), get_u32 (bytes, off + 12));

        if (tag == "head")
            put_u32 (data, 8, 0);

        BOOST_TEST (
            get_u32 (bytes, off + 4) == checksum_of (data.data (), data.size ()));
    }
}

BOOST_AUTO_TEST_CASE(short_offsets) {
    auto font = test::make_test_font ();

    const auto glyphs = font.glyphs ();

    std::string loca;

    for (size_t i = 0, off = 0; i <= glyphs.size (); ++i) {
        append_u16 (loca, uint16_t (off / 2));

        if (i < glyphs.size ())
            off += glyphs [i].size ();
    }

    auto head = font.table ("head");
    put_u16 (head, 50, 0);

    font.set_table ("head", head);
    font.set_table ("loca", loca);

    BOOST_TEST ((font.glyphs () == glyphs));
}

BOOST_AUTO_TEST_CASE(trailing_side_bearings) {
    auto font = test::make_test_font ();

    std::string hmtx;

    append_u16 (hmtx, 500);
    append_u16 (hmtx, 0);
    append_u16 (hmtx, 250);
    append_u16 (hmtx, 10);

    for (size_t i = 2; i < test::glyph_count; ++i)
        append_u16 (hmtx, uint16_t (i));

    auto hhea = font.table ("hhea");
    put_u16 (hhea, 34, 2);

    font.set_table ("hhea", hhea);
    font.set_table ("hmtx", hmtx);

    const auto metrics = font.hmetrics ();

    BOOST_TEST_REQUIRE (metrics.size () == size_t (test::glyph_count));

    BOOST_TEST (metrics [1].advance == 250U);
    BOOST_TEST (metrics [1].lsb == 10);

    BOOST_TEST (metrics [4].advance == 250U);
    BOOST_TEST (metrics [4].lsb == 4);
}

BOOST_AUTO_TEST_CASE(malformed) {
    BOOST_CHECK_THROW (truetype_t::parse ("OTTO\0\0\0\0", 8), font_error);
    BOOST_CHECK_THROW (truetype_t::parse ("\0\1", 2), font_error);

    auto font = test::make_test_font ();
    font.erase_table ("maxp");

    const auto bytes = font.serialize ();
    BOOST_CHECK_THROW (truetype_t::parse (bytes.data (), bytes.size ()), font_error);

    BOOST_CHECK_THROW (truetype_t::load ("/nonexistent/font.ttf"), font_error);
}

BOOST_AUTO_TEST_SUITE_END()
