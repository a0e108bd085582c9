// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE respan

#include <defs.hh>

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <attack/chunk_planner.hh>

#include <utils/string.hh>

using namespace respan;
using namespace respan::attack;

namespace {

//
// Printable ASCII and the space, 500 units wide except for `W' (1000) and
// `i' (250); nothing else is mapped:
//
struct ascii_lookup_t : glyph_lookup_t {
    unsigned glyph_index (wchar_t c) const override {
        return 0x20 <= c && c < 0x7F ? unsigned (c) : 0U;
    }

    std::string glyph_name (wchar_t c) const override {
        return c == L' ' ? "space" : to_utf8 (c);
    }

    double glyph_width (wchar_t c) const override {
        return c == L'W' ? 1000 : c == L'i' ? 250 : 500;
    }
};

std::wstring visual_of (const attack_plan_t& xs) {
    std::wstring s;

    for (const auto& x : xs)
        s += x.visual;

    return s;
}

} // anonymous

BOOST_AUTO_TEST_SUITE(chunk_planner)

BOOST_AUTO_TEST_CASE(visual_longer) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (L"a", L"Bob");

    BOOST_TEST_REQUIRE (xs.size () == 1U);

    BOOST_TEST ((xs [0].visual == L"Bob"));
    BOOST_TEST ((xs [0].hidden == L'a'));
    BOOST_TEST (xs [0].requires_font ());
    BOOST_TEST (!xs [0].is_zero_width ());

    BOOST_TEST (xs [0].advance == 1500.);
    BOOST_TEST ((xs [0].glyph_names == std::vector< std::string >{ "B", "o", "b" }));
}

BOOST_AUTO_TEST_CASE(hidden_longer) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (L"abc", L"X");

    BOOST_TEST_REQUIRE (xs.size () == 3U);

    BOOST_TEST ((xs [0].visual == L"X"));
    BOOST_TEST (!xs [0].is_zero_width ());

    BOOST_TEST (xs [1].is_zero_width ());
    BOOST_TEST (xs [2].is_zero_width ());

    BOOST_TEST (xs [1].requires_font ());
    BOOST_TEST (xs [1].advance == 0.);
}

BOOST_AUTO_TEST_CASE(identity) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (L"abc", L"abc");

    BOOST_TEST_REQUIRE (xs.size () == 3U);

    for (const auto& x : xs)
        BOOST_TEST (!x.requires_font ());
}

BOOST_AUTO_TEST_CASE(proportional_chunks) {
    const ascii_lookup_t lookup;

    //
    // 3500 units over two positions, 1750 each:
    //
    const auto xs = chunk_planner_t (lookup).plan (L"ab", L"WWiiiiii");

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    BOOST_TEST ((xs [0].visual == L"WW"));
    BOOST_TEST ((xs [1].visual == L"iiiiii"));

    BOOST_TEST (xs [0].advance == 2000.);
    BOOST_TEST (xs [1].advance == 1500.);
}

BOOST_AUTO_TEST_CASE(every_position_renders) {
    const ascii_lookup_t lookup;

    //
    // The wide glyph alone exceeds the target, yet the positions after it
    // still get one character each:
    //
    const auto xs = chunk_planner_t (lookup).plan (L"abc", L"Wiiii");

    BOOST_TEST_REQUIRE (xs.size () == 3U);

    for (const auto& x : xs)
        BOOST_TEST (!x.is_zero_width ());

    BOOST_TEST ((visual_of (xs) == L"Wiiii"));
}

BOOST_AUTO_TEST_CASE(white_space) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (L"a b cd", L"x y");

    BOOST_TEST_REQUIRE (xs.size () == 6U);

    BOOST_TEST ((xs [0].visual == L"x"));
    BOOST_TEST ((xs [1].visual == L" "));
    BOOST_TEST ((xs [2].visual == L"y"));

    //
    // No white-space left to render:
    //
    BOOST_TEST (xs [3].is_zero_width ());
    BOOST_TEST (xs [4].is_zero_width ());
    BOOST_TEST (xs [5].is_zero_width ());

    BOOST_TEST (xs [1].glyph_names [0] == "space");
}

BOOST_AUTO_TEST_CASE(leading_white_space) {
    const ascii_lookup_t lookup;

    //
    // The spaces in front of `z' render with it, at `b':
    //
    const auto xs = chunk_planner_t (lookup).plan (L"ab cd", L"x  z");

    BOOST_TEST_REQUIRE (xs.size () == 5U);

    BOOST_TEST ((xs [0].visual == L"x"));
    BOOST_TEST ((xs [1].visual == L"  z"));
    BOOST_TEST (xs [1].advance == 1500.);

    BOOST_TEST (xs [2].is_zero_width ());
    BOOST_TEST (xs [3].is_zero_width ());
    BOOST_TEST (xs [4].is_zero_width ());
}

BOOST_AUTO_TEST_CASE(leftover_visual) {
    const ascii_lookup_t lookup;

    {
        //
        // The hidden space renders nothing; `z' goes with the last
        // character:
        //
        const auto xs = chunk_planner_t (lookup).plan (L"a b", L"xyz");

        BOOST_TEST_REQUIRE (xs.size () == 3U);

        BOOST_TEST ((xs [0].visual == L"x"));
        BOOST_TEST (xs [1].is_zero_width ());
        BOOST_TEST ((xs [2].visual == L"yz"));
    }

    {
        const auto xs = chunk_planner_t (lookup).plan (L"  ", L"x");

        BOOST_TEST_REQUIRE (xs.size () == 2U);

        BOOST_TEST (xs [0].is_zero_width ());
        BOOST_TEST ((xs [1].visual == L"x"));
    }
}

BOOST_AUTO_TEST_CASE(empty_visual) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (L"abc", L"");

    BOOST_TEST_REQUIRE (xs.size () == 3U);

    for (const auto& x : xs) {
        BOOST_TEST (x.is_zero_width ());
        BOOST_TEST (x.requires_font ());
    }
}

BOOST_AUTO_TEST_CASE(empty_hidden) {
    const ascii_lookup_t lookup;

    BOOST_CHECK_THROW (
        chunk_planner_t (lookup).plan (L"", L"x"), empty_hidden_text_error);
}

BOOST_AUTO_TEST_CASE(missing_glyphs) {
    const ascii_lookup_t lookup;

    try {
        chunk_planner_t (lookup).plan (L"ab\x00E9", L"\x00E9x\x2603\x2603");
        BOOST_FAIL ("expected a glyph lookup error");
    }
    catch (const glyph_lookup_error& e) {
        BOOST_TEST_REQUIRE (e.missing.size () == 2U);
        BOOST_TEST ((e.missing [0] == L'\x00E9'));
        BOOST_TEST ((e.missing [1] == L'\x2603'));

        BOOST_TEST (std::string (e.what ()).find ("U+2603") != std::string::npos);
    }
}

static const std::vector< std::tuple< std::string, std::string > >
concatenation_dataset{
    { "a", "Bob" },
    { "abcdef", "Hello World" },
    { "Mercury", "Mars" },
    { "Mars", "Mercury" },
    { "secret", "Wiiiiiiiiii" },
    { "xyz", "xyz" },
    { "a b", "xyz" },
    { "abc", "x y" },
    { "ab cd", "x  z" },
    { "a  b", "x y" },
    { "  a", " x" }
};

BOOST_DATA_TEST_CASE(
    concatenation, data::make (concatenation_dataset), hidden, visual) {
    const ascii_lookup_t lookup;

    const auto xs = chunk_planner_t (lookup).plan (
        from_utf8 (hidden), from_utf8 (visual));

    BOOST_TEST (xs.size () == hidden.size ());
    BOOST_TEST (to_utf8 (visual_of (xs)) == visual);

    for (size_t i = 0; i < xs.size (); ++i)
        BOOST_TEST (xs [i].index == i);
}

BOOST_AUTO_TEST_SUITE_END()
