// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE respan

#include <defs.hh>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <attack/chunk_planner.hh>
#include <attack/font_builder.hh>
#include <attack/font_store.hh>
#include <attack/glyph_lookup.hh>
#include <fofi/truetype.hh>
#include <respan/Error.hh>

#include <test/font_fixture.hh>

using namespace respan;
using namespace respan::attack;

namespace {

struct font_fixture_t {
    font_fixture_t ()
        : path (test::write_test_font (dir.path)),
          lookup (path),
          builder (path, lookup) {
        setErrorQuiet (true);
    }

    attack_plan_t plan (const std::wstring& hidden, const std::wstring& visual) {
        return chunk_planner_t (lookup).plan (hidden, visual);
    }

    fofi::truetype_t build (const attack_position_t& position) {
        const auto bytes = builder.build (position);
        return fofi::truetype_t::parse (bytes.data (), bytes.size ());
    }

    test::scratch_dir_t dir;
    fs::path path;

    ft_glyph_lookup_t lookup;
    font_builder_t builder;
};

std::string read_file (const fs::path& path) {
    std::ifstream in (path, std::ios::binary);
    return { std::istreambuf_iterator< char > (in), { } };
}

} // anonymous

BOOST_FIXTURE_TEST_SUITE(font_builder, font_fixture_t)

BOOST_AUTO_TEST_CASE(glyph_lookup) {
    BOOST_TEST (lookup.units_per_em () == 1000U);

    BOOST_TEST (lookup.glyph_index (L'a') == unsigned (test::a_gid));
    BOOST_TEST (lookup.glyph_index (L'z') == 0U);
    BOOST_TEST (!lookup.has (L'z'));

    BOOST_TEST (lookup.glyph_width (L'B') == 600.);
    BOOST_TEST (lookup.glyph_name (L'o') == "gid4");

    BOOST_CHECK_THROW (lookup.glyph_width (L'z'), glyph_lookup_error);
    BOOST_CHECK_THROW (ft_glyph_lookup_t (dir.path / "none.ttf"), fofi::font_error);
}

BOOST_AUTO_TEST_CASE(composite) {
    const auto xs = plan (L"a", L"Bob");

    BOOST_TEST_REQUIRE (xs.size () == 1U);
    BOOST_TEST (xs [0].advance == 1650.);

    const auto font = build (xs [0]);

    BOOST_TEST (font.num_glyphs () == unsigned (test::glyph_count));

    const auto glyphs = font.glyphs ();
    const auto& glyph = glyphs [test::a_gid];

    BOOST_TEST ((components_of (glyph) == std::vector< unsigned >{
                test::B_gid, test::o_gid, test::b_gid }));

    //
    // Components sit side by side, each at the advance of the previous ones:
    //
    BOOST_TEST (fofi::get_s16 (glyph, 10 + 4) == 0);
    BOOST_TEST (fofi::get_s16 (glyph, 18 + 4) == 600);
    BOOST_TEST (fofi::get_s16 (glyph, 26 + 4) == 1150);

    //
    // Only the last component ends the list:
    //
    BOOST_TEST (((fofi::get_u16 (glyph, 10) & 0x0020) != 0));
    BOOST_TEST (((fofi::get_u16 (glyph, 26) & 0x0020) == 0));

    BOOST_TEST (fofi::get_s16 (glyph, 0) == -1);
    BOOST_TEST (fofi::get_s16 (glyph, 2) == 50);
    BOOST_TEST (fofi::get_s16 (glyph, 6) == 1150 + 450);
    BOOST_TEST (fofi::get_s16 (glyph, 8) == 700);

    const auto metrics = font.hmetrics ();

    BOOST_TEST (metrics [test::a_gid].advance == 1650U);
    BOOST_TEST (metrics [test::a_gid].lsb == 50);

    //
    // Everything else is left alone:
    //
    BOOST_TEST (metrics [test::B_gid].advance == 600U);
    BOOST_TEST (components_of (glyphs [test::B_gid]).empty ());

    BOOST_TEST (fofi::get_u16 (font.table ("maxp"), 28) >= 3U);
}

BOOST_AUTO_TEST_CASE(renders_with_freetype) {
    const auto xs = plan (L"a", L"Bob");

    const auto target = dir.path / "derived.ttf";
    publish_file (target, builder.build (xs [0]));

    const ft_glyph_lookup_t derived (target);

    BOOST_TEST (derived.glyph_width (L'a') == 1650.);
    BOOST_TEST (derived.glyph_width (L'o') == 550.);
}

BOOST_AUTO_TEST_CASE(zero_width) {
    const auto xs = plan (L"abc", L"o");

    BOOST_TEST_REQUIRE (xs.size () == 3U);
    BOOST_TEST_REQUIRE (xs [1].is_zero_width ());

    const auto font = build (xs [1]);

    BOOST_TEST (font.glyphs () [test::b_gid].empty ());

    const auto metrics = font.hmetrics ();

    BOOST_TEST (metrics [test::b_gid].advance == 0U);
    BOOST_TEST (metrics [test::b_gid].lsb == 0);
}

BOOST_AUTO_TEST_CASE(self_reference) {
    const auto xs = plan (L"a", L"aa");

    const auto font = build (xs [0]);

    //
    // The original outline of `a' survives as a new glyph:
    //
    BOOST_TEST (font.num_glyphs () == unsigned (test::glyph_count + 1));

    const auto glyphs = font.glyphs ();

    BOOST_TEST ((components_of (glyphs [test::a_gid]) == std::vector< unsigned >{
                test::glyph_count, test::glyph_count }));

    BOOST_TEST (glyphs [test::glyph_count].substr (0, 34) ==
                test::rectangle_glyph (50, 0, 450, 500));

    BOOST_TEST (font.hmetrics ().size () == size_t (test::glyph_count + 1));
    BOOST_TEST (fofi::get_u32 (font.table ("post"), 0) == 0x00030000U);
}

BOOST_AUTO_TEST_CASE(drawing_the_hidden_glyph) {
    //
    // `c' is drawn with `o', which is about to be replaced:
    //
    const auto xs = plan (L"o", L"c");

    BOOST_CHECK_THROW (builder.build (xs [0]), fofi::font_error);

    const auto report = builder.build_fonts (xs, dir.path / "out");

    BOOST_TEST (report.results.empty ());
    BOOST_TEST_REQUIRE (report.failures.size () == 1U);
    BOOST_TEST (report.failures [0].index == 0U);
}

BOOST_AUTO_TEST_CASE(missing_glyphs) {
    attack_position_t position{ 0, L'a', L"az" };

    BOOST_CHECK_THROW (builder.build (position), glyph_lookup_error);

    const auto report = builder.build_fonts ({ position }, dir.path / "out");

    BOOST_TEST_REQUIRE (report.failures.size () == 1U);
    BOOST_TEST ((report.failures [0].missing == std::vector< wchar_t >{ L'z' }));
}

BOOST_AUTO_TEST_CASE(coordinate_range) {
    //
    // 600 units a glyph; the 55th starts past 32767:
    //
    const attack_position_t position{ 0, L'a', std::wstring (60, L'B') };

    BOOST_CHECK_THROW (builder.build (position), fofi::font_error);

    const auto report = builder.build_fonts (
        { position, { 1, L'b', L"Bob" } }, dir.path / "out");

    BOOST_TEST_REQUIRE (report.failures.size () == 1U);
    BOOST_TEST (report.failures [0].index == 0U);

    BOOST_TEST_REQUIRE (report.results.size () == 1U);
    BOOST_TEST (report.results [0].index == 1U);

    //
    // Short of the limit:
    //
    BOOST_CHECK_NO_THROW (builder.build ({ 0, L'a', std::wstring (50, L'B') }));
}

BOOST_AUTO_TEST_CASE(unwritable_target) {
    const auto xs = plan (L"ab", L"oBob");

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    //
    // A non-empty directory is in the way of the first font:
    //
    const auto out = dir.path / "out";
    fs::create_directories (out / "attack_pos0.ttf" / "x");

    const auto report = builder.build_fonts (xs, out);

    BOOST_TEST_REQUIRE (report.failures.size () == 1U);
    BOOST_TEST (report.failures [0].index == 0U);

    BOOST_TEST_REQUIRE (report.results.size () == 1U);
    BOOST_TEST (report.results [0].index == 1U);
    BOOST_TEST (fs::exists (out / "attack_pos1.ttf"));
}

BOOST_AUTO_TEST_CASE(build_fonts) {
    const auto xs = plan (L"ab", L"Bob");

    BOOST_TEST_REQUIRE (xs.size () == 2U);
    BOOST_TEST ((xs [0].visual == L"Bo"));
    BOOST_TEST ((xs [1].visual == L"b"));

    const auto out = dir.path / "out";
    const auto report = builder.build_fonts (xs, out);

    BOOST_TEST (report.failures.empty ());

    //
    // `b' renders as itself and needs no font:
    //
    BOOST_TEST_REQUIRE (report.results.size () == 1U);
    BOOST_TEST (report.results [0].path == out / "attack_pos0.ttf");
    BOOST_TEST (!report.results [0].cached);

    BOOST_TEST (fs::exists (out / "attack_pos0.ttf"));
    BOOST_TEST (!fs::exists (out / "attack_pos1.ttf"));

    //
    // Nothing but the published fonts is left behind:
    //
    BOOST_TEST (std::distance (fs::directory_iterator (out), { }) == 1);
}

BOOST_AUTO_TEST_CASE(cache) {
    const auto xs = plan (L"a", L"Bob");

    fs_font_store_t store (dir.path / "cache");

    const auto first = builder.build_fonts (xs, dir.path / "one", &store);

    BOOST_TEST_REQUIRE (first.results.size () == 1U);
    BOOST_TEST (!first.results [0].cached);

    const auto key = builder.cache_key (xs [0]);
    BOOST_TEST_REQUIRE (store.get (key).has_value ());

    const auto second = builder.build_fonts (xs, dir.path / "two", &store);

    BOOST_TEST_REQUIRE (second.results.size () == 1U);
    BOOST_TEST (second.results [0].cached);

    BOOST_TEST (read_file (dir.path / "one" / "attack_pos0.ttf") ==
                read_file (dir.path / "two" / "attack_pos0.ttf"));
}

BOOST_AUTO_TEST_CASE(corrupt_cache_entry) {
    const auto xs = plan (L"a", L"Bob");

    fs_font_store_t store (dir.path / "cache");

    std::ofstream (store.path () / (builder.cache_key (xs [0]) + ".ttf"))
        << "not a font";

    const auto report = builder.build_fonts (xs, dir.path / "out", &store);

    BOOST_TEST_REQUIRE (report.results.size () == 1U);
    BOOST_TEST (!report.results [0].cached);

    const auto path = report.results [0].path;
    const auto bytes = read_file (path);

    BOOST_CHECK_NO_THROW (fofi::truetype_t::parse (bytes.data (), bytes.size ()));
}

BOOST_AUTO_TEST_CASE(cache_key) {
    const auto xs = plan (L"ab", L"Bob");

    const auto key = builder.cache_key (xs [0]);

    BOOST_TEST (key.size () == 32U);
    BOOST_TEST (key.find_first_not_of ("0123456789abcdef") == std::string::npos);

    BOOST_TEST (key == builder.cache_key (xs [0]));
    BOOST_TEST (key != builder.cache_key (xs [1]));

    auto position = xs [0];
    position.advance += 0.25;

    BOOST_TEST (key == builder.cache_key (position));

    position.advance += 1;
    BOOST_TEST (key != builder.cache_key (position));
}

BOOST_AUTO_TEST_CASE(font_store) {
    fs_font_store_t store (dir.path / "store");

    BOOST_TEST (!store.get ("abc").has_value ());

    store.put ("abc", "first");
    store.put ("abc", "second");

    const auto path = store.get ("abc");

    BOOST_TEST_REQUIRE (path.has_value ());
    BOOST_TEST (read_file (*path) == "first");
}

BOOST_AUTO_TEST_SUITE_END()
