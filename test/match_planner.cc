// -*- mode: c++ -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE respan

#include <defs.hh>

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <respan/Error.hh>
#include <respan/analysis.hh>
#include <respan/match_planner.hh>

#include <test/common.hh>

using namespace respan;
using respan::test::make_page;
using respan::test::make_span;
using respan::test::parse;

namespace {

page_analysis_t
analyze (const std::string& content, const std::vector< layout_span_t >& xs) {
    return analyze_page (parse (content), make_page (xs), params_t{ });
}

replacement_plan_t
plan_of (const page_analysis_t& analysis,
         const std::wstring& target, const std::wstring& replacement) {
    return build_replacement_plan (
        0, target, replacement, analysis.records, analysis.alignment);
}

std::vector< replacement_segment_t >
matches_of (const replacement_plan_t& plan) {
    std::vector< replacement_segment_t > xs;

    for (const auto& x : plan.segments)
        if (x.role == segment_role_t::match)
            xs.push_back (x);

    return xs;
}

std::wstring planned_text_of (const replacement_plan_t& plan) {
    std::wstring s;

    for (const auto& x : matches_of (plan))
        s += x.planned_text;

    return s;
}

} // anonymous

BOOST_AUTO_TEST_SUITE(match_planner)

BOOST_AUTO_TEST_CASE(single_literal) {
    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm (Mercury) Tj ET",
        { make_span (L"Mercury", 72, 700) });

    const auto plan = plan_of (analysis, L"Mercury", L"Mars");

    BOOST_TEST ((plan.original_text == L"Mercury"));
    BOOST_TEST_REQUIRE (plan.segments.size () == 1U);

    const auto& segment = plan.segments [0];

    BOOST_TEST ((segment.role == segment_role_t::match));
    BOOST_TEST (segment.operator_index == 3U);
    BOOST_TEST ((segment.planned_text == L"Mars"));
    BOOST_TEST (*segment.replacement_start == 0U);
    BOOST_TEST (*segment.replacement_end == 4U);

    BOOST_TEST ((segment.literal_kind == literal_kind_t::text));
    BOOST_TEST (*segment.font == "F1");
    BOOST_TEST (segment.font_size == 12.);

    BOOST_TEST (segment.width == 42., boost::test_tools::tolerance (1e-9));
    BOOST_TEST (segment.matrix.a == 12.);
    BOOST_TEST (segment.matrix.e == 72.);
    BOOST_TEST (segment.matrix.f == 700.);
}

BOOST_AUTO_TEST_CASE(array_literals) {
    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm [(Merc) -20 (ury)] TJ ET",
        { make_span (L"Mercury", 72, 700) });

    const auto plan = plan_of (analysis, L"Mercury", L"Mars");
    const auto matches = matches_of (plan);

    BOOST_TEST_REQUIRE (matches.size () == 2U);

    BOOST_TEST ((matches [0].text == L"Merc"));
    BOOST_TEST ((matches [1].text == L"ury"));

    BOOST_TEST ((matches [0].planned_text == L"Ma"));
    BOOST_TEST ((matches [1].planned_text == L"rs"));

    BOOST_TEST (*matches [0].replacement_end == *matches [1].replacement_start);

    //
    // The second literal starts at its own glyph:
    //
    BOOST_TEST (matches [1].matrix.e == 96., boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_CASE(across_operators) {
    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm (Hello) Tj (World) Tj ET",
        { make_span (L"HelloWorld", 72, 700) });

    const auto plan = plan_of (analysis, L"loWo", L"XY");

    BOOST_TEST_REQUIRE (plan.segments.size () == 4U);

    BOOST_TEST ((plan.segments [0].role == segment_role_t::prefix));
    BOOST_TEST ((plan.segments [0].text == L"Hel"));

    BOOST_TEST ((plan.segments [1].role == segment_role_t::match));
    BOOST_TEST ((plan.segments [1].text == L"lo"));
    BOOST_TEST (plan.segments [1].local_start == 3U);

    BOOST_TEST ((plan.segments [2].role == segment_role_t::match));
    BOOST_TEST ((plan.segments [2].text == L"Wo"));
    BOOST_TEST (plan.segments [2].operator_index == 4U);

    BOOST_TEST ((plan.segments [3].role == segment_role_t::suffix));
    BOOST_TEST ((plan.segments [3].text == L"rld"));

    BOOST_TEST ((planned_text_of (plan) == L"XY"));
}

BOOST_AUTO_TEST_CASE(segments_tile_the_operator) {
    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm [(The ) (Mercury) ( rover)] TJ ET",
        { make_span (L"The Mercury rover", 72, 700) });

    const auto plan = plan_of (analysis, L"Mercury", L"Venus");

    size_t cursor = 0;

    for (const auto& segment : plan.segments) {
        BOOST_TEST (segment.local_start == cursor);
        cursor = segment.local_end;
    }

    BOOST_TEST (cursor == 17U);
    BOOST_TEST ((planned_text_of (plan) == L"Venus"));
}

BOOST_AUTO_TEST_CASE(whitespace_fallback) {
    const auto analysis = analyze (
        "BT /F1 12 Tf (Hello World) Tj ET",
        { make_span (L"Hello World", 72, 700) });

    const auto plan = plan_of (analysis, L"HelloWorld", L"Hi");

    BOOST_TEST ((plan.original_text == L"Hello World"));
    BOOST_TEST ((planned_text_of (plan) == L"Hi"));

    const auto range = whitespace_insensitive_match (L"a b  c", L"bc");

    BOOST_TEST_REQUIRE (range.has_value ());
    BOOST_TEST (range->start == 2U);
    BOOST_TEST (range->end == 6U);
}

BOOST_AUTO_TEST_CASE(ligature_and_double_space) {
    //
    // The ligature code expands to two characters, the double space
    // collapses to one; the slices are in the span's characters:
    //
    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm (\\014nd the  cat) Tj ET",
        { make_span (L"find the cat", 72, 700) });

    const auto plan = plan_of (analysis, L"the", L"a");

    BOOST_TEST_REQUIRE (plan.segments.size () == 3U);

    const auto& prefix = plan.segments [0];
    const auto& match = plan.segments [1];
    const auto& suffix = plan.segments [2];

    BOOST_TEST ((match.role == segment_role_t::match));
    BOOST_TEST ((match.text == L"the"));
    BOOST_TEST (match.local_start == 4U);
    BOOST_TEST (match.local_end == 7U);

    BOOST_TEST_REQUIRE (prefix.slices.size () == 1U);
    BOOST_TEST (prefix.slices [0].start == 0U);
    BOOST_TEST (prefix.slices [0].end == 4U);

    BOOST_TEST_REQUIRE (match.slices.size () == 1U);
    BOOST_TEST (match.slices [0].start == 5U);
    BOOST_TEST (match.slices [0].end == 8U);

    BOOST_TEST_REQUIRE (suffix.slices.size () == 1U);
    BOOST_TEST (suffix.slices [0].start == 8U);
    BOOST_TEST (suffix.slices [0].end == 12U);

    BOOST_TEST (match.matrix.e == 102., boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_CASE(unaligned_operator) {
    setErrorQuiet (true);

    const auto analysis = analyze (
        "BT /F1 12 Tf 1 0 0 1 72 700 Tm (Mercury) Tj ET", { });

    const auto plan = plan_of (analysis, L"Mercury", L"Mars");

    BOOST_TEST_REQUIRE (plan.segments.size () == 1U);
    BOOST_TEST (plan.segments [0].slices.empty ());

    //
    // Placement falls back on the operator's text matrix:
    //
    BOOST_TEST (plan.segments [0].matrix.e == 72.);
    BOOST_TEST (plan.segments [0].matrix.f == 700.);
}

BOOST_AUTO_TEST_CASE(not_found) {
    const auto analysis = analyze (
        "BT /F1 12 Tf (Mercury) Tj ET", { make_span (L"Mercury", 0, 0) });

    BOOST_CHECK_THROW (
        plan_of (analysis, L"Jupiter", L"Mars"), match_not_found_error);

    BOOST_CHECK_THROW (
        plan_of (analysis, L"", L"Mars"), match_not_found_error);
}

BOOST_AUTO_TEST_CASE(isolation) {
    setErrorQuiet (true);

    const auto analysis = analyze (
        "BT /F1 12 Tf [(a) (b) (c)] TJ ET", { make_span (L"abc", 0, 0) });

    const auto plan = plan_of (analysis, L"abc", L"X");
    const auto matches = matches_of (plan);

    BOOST_TEST_REQUIRE (matches.size () == 3U);

    BOOST_TEST (matches [0].requires_isolation);
    BOOST_TEST (matches [1].requires_isolation);
    BOOST_TEST (!matches [2].requires_isolation);

    BOOST_TEST ((matches [2].planned_text == L"X"));
}

BOOST_AUTO_TEST_CASE(allocation) {
    {
        const auto xs = allocate_replacement (L"Mars", { 4, 3 });

        BOOST_TEST_REQUIRE (xs.size () == 2U);
        BOOST_TEST ((xs [0] == L"Ma"));
        BOOST_TEST ((xs [1] == L"rs"));
    }

    {
        const auto xs = allocate_replacement (L"abcdef", { 2, 2, 2 });

        BOOST_TEST_REQUIRE (xs.size () == 3U);
        BOOST_TEST ((xs [0] == L"ab"));
        BOOST_TEST ((xs [1] == L"cd"));
        BOOST_TEST ((xs [2] == L"ef"));
    }

    {
        //
        // Every segment with original text keeps at least one character
        // while there are characters to go around:
        //
        const auto xs = allocate_replacement (L"abc", { 10, 1, 1 });

        BOOST_TEST_REQUIRE (xs.size () == 3U);
        BOOST_TEST ((xs [0] == L"a"));
        BOOST_TEST ((xs [1] == L"b"));
        BOOST_TEST ((xs [2] == L"c"));
    }

    {
        const auto xs = allocate_replacement (L"ab", { 0, 3 });

        BOOST_TEST_REQUIRE (xs.size () == 2U);
        BOOST_TEST (xs [0].empty ());
        BOOST_TEST ((xs [1] == L"ab"));
    }

    BOOST_TEST (allocate_replacement (L"ab", { }).empty ());
}

BOOST_AUTO_TEST_CASE(sub_slices) {
    const auto spans = extract_spans (make_page ({
                make_span (L"Hello", 0, 0), make_span (L"World", 40, 0) }));

    const span_slices_t slices{ { spans [0], 0, 5 }, { spans [1], 0, 5 } };

    const auto xs = slice_span_slices (slices, 3, 7);

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    BOOST_TEST (xs [0].start == 3U);
    BOOST_TEST (xs [0].end == 5U);
    BOOST_TEST (xs [1].start == 0U);
    BOOST_TEST (xs [1].end == 2U);

    BOOST_TEST (slice_span_slices (slices, 4, 4).empty ());
}

BOOST_AUTO_TEST_SUITE_END()
