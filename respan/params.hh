// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARAMS_HH
#define RESPAN_RESPAN_PARAMS_HH

#include <defs.hh>

#include <cstddef>
#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

namespace respan {

//
// Analysis and font attack tunables, read from a respanrc file:
//
//   # comment
//   alignMinLength      16
//   driftTolerance      0.5
//   naiveGlyphWidth     0.5
//   minHorizontalScale  0.01
//   fontCacheDir        ~/.cache/respan
//   fontOutputDir       "/tmp/fonts"
//   include             other.rc
//
struct params_t {
    size_t align_min_length = RESPAN_ALIGN_MIN_LENGTH;

    double drift_tolerance = RESPAN_DRIFT_TOLERANCE;
    double naive_glyph_width = RESPAN_NAIVE_GLYPH_WIDTH;
    double min_horizontal_scale = RESPAN_MIN_HORIZONTAL_SCALE;

    fs::path font_cache_dir;
    fs::path font_output_dir = ".";
};

//
// Reads the named file, or, if empty, ~/.respanrc when it exists. Problems
// are reported and the defaults kept.
//
params_t load_params (const fs::path& = { });

void parse_params (params_t&, const std::string& text, const fs::path& source);

} // namespace respan

#endif // RESPAN_RESPAN_PARAMS_HH
