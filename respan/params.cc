// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <respan/Error.hh>
#include <respan/params.hh>

#include <utils/path.hh>
#include <utils/string.hh>

namespace respan {
namespace {

const int max_include_depth = 8;

void parse_file (params_t&, const fs::path&, int);

void
bad_command (const std::string& cmd, const fs::path& source, int line) {
    error (errConfig, -1, "Bad '{}' config file command ({}:{})",
           cmd, source.string (), line);
}

bool
parse_float (const std::vector< std::string >& tokens, double& value,
             const fs::path& source, int line) {
    if (tokens.size () != 2) {
        return bad_command (tokens [0], source, line), false;
    }

    const auto& tok = tokens [1];
    char* end = 0;

    const double x = std::strtod (tok.c_str (), &end);

    if (tok.empty () || *end) {
        return bad_command (tokens [0], source, line), false;
    }

    return value = x, true;
}

bool
parse_integer (const std::vector< std::string >& tokens, size_t& value,
               const fs::path& source, int line) {
    if (tokens.size () != 2) {
        return bad_command (tokens [0], source, line), false;
    }

    const auto& tok = tokens [1];

    if (tok.empty () ||
        tok.find_first_not_of ("0123456789") != std::string::npos) {
        return bad_command (tokens [0], source, line), false;
    }

    return value = std::strtoul (tok.c_str (), 0, 10), true;
}

bool
parse_path (const std::vector< std::string >& tokens, fs::path& value,
            const fs::path& source, int line) {
    if (tokens.size () != 2) {
        return bad_command (tokens [0], source, line), false;
    }

    return value = expand_path (tokens [1]), true;
}

void
parse_line (params_t& params, const std::string& buf, const fs::path& source,
            int line, int depth) {
    const auto tokens = tokenize (buf);

    if (tokens.empty () || tokens [0][0] == '#')
        return;

    const auto& cmd = tokens [0];

    if (cmd == "include") {
        if (tokens.size () != 2) {
            bad_command (cmd, source, line);
        }
        else if (depth >= max_include_depth) {
            error (errConfig, -1,
                   "Config file includes nested too deep ({}:{})",
                   source.string (), line);
        }
        else {
            auto path = expand_path (tokens [1]);

            if (path.is_relative ())
                path = source.parent_path () / path;

            if (fs::exists (path)) {
                parse_file (params, path, depth + 1);
            }
            else {
                error (errConfig, -1,
                       "Couldn't find included config file: '{}' ({}:{})",
                       tokens [1], source.string (), line);
            }
        }
    }
    else if (cmd == "alignMinLength") {
        size_t value = 0;

        if (parse_integer (tokens, value, source, line)) {
            if (value == 0)
                bad_command (cmd, source, line);
            else
                params.align_min_length = value;
        }
    }
    else if (cmd == "driftTolerance") {
        parse_float (tokens, params.drift_tolerance, source, line);
    }
    else if (cmd == "naiveGlyphWidth") {
        parse_float (tokens, params.naive_glyph_width, source, line);
    }
    else if (cmd == "minHorizontalScale") {
        double value = 0;

        if (parse_float (tokens, value, source, line)) {
            if (value <= 0 || value > 1)
                bad_command (cmd, source, line);
            else
                params.min_horizontal_scale = value;
        }
    }
    else if (cmd == "fontCacheDir") {
        parse_path (tokens, params.font_cache_dir, source, line);
    }
    else if (cmd == "fontOutputDir") {
        parse_path (tokens, params.font_output_dir, source, line);
    }
    else {
        error (errConfig, -1, "Unknown config file command '{}' ({}:{})",
               cmd, source.string (), line);
    }
}

void
parse_text (params_t& params, std::istream& stream, const fs::path& source,
            int depth) {
    std::string buf;

    for (int line = 1; std::getline (stream, buf); ++line) {
        parse_line (params, buf, source, line, depth);
    }
}

void parse_file (params_t& params, const fs::path& path, int depth) {
    std::ifstream stream (path);

    if (!stream) {
        error (errIO, -1, "Couldn't open config file '{}'", path.string ());
        return;
    }

    parse_text (params, stream, path, depth);
}

} // anonymous

void
parse_params (params_t& params, const std::string& text,
              const fs::path& source) {
    std::istringstream stream (text);
    parse_text (params, stream, source, 0);
}

params_t load_params (const fs::path& path) {
    params_t params;

    if (!path.empty ()) {
        parse_file (params, path, 0);
    }
    else {
        const auto rc = home_path () / RESPAN_RC_FILE;

        if (fs::exists (rc))
            parse_file (params, rc, 0);
    }

    return params;
}

} // namespace respan
