// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_ATTACK_FONT_BUILDER_HH
#define RESPAN_ATTACK_FONT_BUILDER_HH

#include <defs.hh>

#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

#include <attack/chunk_planner.hh>
#include <attack/font_store.hh>
#include <attack/glyph_lookup.hh>
#include <fofi/truetype.hh>

namespace respan::attack {

struct font_build_result_t {
    size_t index;

    wchar_t hidden;
    std::wstring visual;

    fs::path path;
    bool cached = false;
};

struct font_build_failure_t {
    size_t index;
    wchar_t hidden;

    std::string message;

    //
    // For glyph lookup failures, the characters the font lacks:
    //
    std::vector< wchar_t > missing;
};

struct font_build_report_t {
    std::vector< font_build_result_t > results;
    std::vector< font_build_failure_t > failures;
};

//
// Derives, from a baseline TrueType font, one font per attack position in
// which the hidden character draws the position's visual text.
//
class font_builder_t {
public:
    font_builder_t (const fs::path&, const glyph_lookup_t&);

    //
    // The derivative font for one position, as file bytes:
    //
    std::string build (const attack_position_t&) const;

    //
    // Writes `attack_pos<index>.ttf' in the output directory for each
    // position which needs a font, reusing stored fonts when a store is
    // given. Failures of single positions are reported, not thrown.
    //
    font_build_report_t
    build_fonts (const attack_plan_t&, const fs::path& output_dir,
                 font_store_t* = 0) const;

    //
    // SHA-1 of the baseline font file name, the hidden character, the visual
    // text and the rounded advance:
    //
    std::string cache_key (const attack_position_t&) const;

private:
    fs::path path_;
    const glyph_lookup_t& lookup_;

    fofi::truetype_t base_;
};

//
// Glyph indices referenced by a composite glyph description, empty for a
// simple glyph:
//
std::vector< unsigned > components_of (const std::string&);

} // namespace respan::attack

#endif // RESPAN_ATTACK_FONT_BUILDER_HH
