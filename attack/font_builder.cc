// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <climits>
#include <cmath>
#include <set>
#include <system_error>

#include <attack/font_builder.hh>
#include <respan/Error.hh>

#include <utils/string.hh>

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid.hpp>

#include <fmt/format.h>

#include <range/v3/algorithm/find.hpp>
using namespace ranges;

namespace respan::attack {

using fofi::get_s16;
using fofi::get_u16;
using fofi::append_u16;

namespace {

//
// Composite glyph flags:
//
enum : uint16_t {
    ARG_1_AND_2_ARE_WORDS    = 0x0001,
    ARGS_ARE_XY_VALUES       = 0x0002,
    WE_HAVE_A_SCALE          = 0x0008,
    MORE_COMPONENTS          = 0x0020,
    WE_HAVE_AN_X_AND_Y_SCALE = 0x0040,
    WE_HAVE_A_TWO_BY_TWO     = 0x0080
};

bool is_composite (const std::string& glyph) {
    return glyph.size () >= 10 && get_s16 (glyph, 0) < 0;
}

//
// Nesting depth of a glyph, 0 for simple glyphs; throws on references back
// to a glyph already on the path:
//
size_t
depth_of (const std::vector< std::string >& glyphs, unsigned gid,
          std::set< unsigned >& path) {
    if (gid >= glyphs.size ())
        throw fofi::font_error ("component glyph out of range");

    if (!path.insert (gid).second)
        throw fofi::font_error ("cyclic composite glyph " + std::to_string (gid));

    size_t depth = 0;

    for (auto x : components_of (glyphs [gid]))
        depth = (std::max) (depth, 1 + depth_of (glyphs, x, path));

    path.erase (gid);

    return depth;
}

bool
references (const std::vector< std::string >& glyphs, unsigned gid,
            unsigned target) {
    for (auto x : components_of (glyphs.at (gid)))
        if (x == target || references (glyphs, x, target))
            return true;

    return false;
}

std::string to_hex (const boost::uuids::uuid& id) {
    std::string s;

    for (auto x : id)
        s += fmt::format ("{:02x}", x);

    return s;
}

//
// Composite arguments and bounding boxes are 16-bit signed quantities:
//
int16_t to_s16 (int value, const char* what) {
    if (value < SHRT_MIN || SHRT_MAX < value) {
        throw fofi::font_error (
            fmt::format ("{} {} does not fit a 16-bit coordinate", what, value));
    }

    return int16_t (value);
}

} // anonymous

std::vector< unsigned > components_of (const std::string& glyph) {
    std::vector< unsigned > xs;

    if (!is_composite (glyph))
        return xs;

    for (size_t off = 10;;) {
        const auto flags = get_u16 (glyph, off);
        xs.push_back (get_u16 (glyph, off + 2));

        off += 4 + (flags & ARG_1_AND_2_ARE_WORDS ? 4 : 2);

        if (flags & WE_HAVE_A_SCALE)
            off += 2;
        else if (flags & WE_HAVE_AN_X_AND_Y_SCALE)
            off += 4;
        else if (flags & WE_HAVE_A_TWO_BY_TWO)
            off += 8;

        if (0 == (flags & MORE_COMPONENTS))
            break;
    }

    return xs;
}

font_builder_t::font_builder_t (const fs::path& path,
                                const glyph_lookup_t& lookup)
    : path_ (path), lookup_ (lookup), base_ (fofi::truetype_t::load (path)) {
    for (const char* tag : { "glyf", "loca", "hmtx" }) {
        if (!base_.has (tag)) {
            throw fofi::font_error (
                path.string () + ": baseline font has no '" + tag + "' table");
        }
    }
}

std::string font_builder_t::build (const attack_position_t& position) const {
    auto font = base_;

    auto glyphs = font.glyphs ();
    auto metrics = font.hmetrics ();

    const auto hidden = lookup_.glyph_index (position.hidden);

    if (0 == hidden || hidden >= glyphs.size ())
        throw glyph_lookup_error ({ position.hidden });

    lookup_.ensure_available (position.visual);

    std::vector< unsigned > gids;

    for (auto c : position.visual)
        gids.push_back (lookup_.glyph_index (c));

    //
    // The hidden glyph is about to be replaced; components which draw it
    // refer to a copy instead:
    //
    if (gids.end () != find (gids, hidden)) {
        glyphs.push_back (glyphs [hidden]);
        metrics.push_back (metrics [hidden]);

        const unsigned copy = glyphs.size () - 1;

        for (auto& x : gids)
            if (x == hidden)
                x = copy;
    }

    for (auto x : gids) {
        if (x != hidden && references (glyphs, x, hidden)) {
            throw fofi::font_error (
                "glyph " + std::to_string (x) + " draws the hidden glyph");
        }
    }

    std::string composite;
    size_t count = 0, depth = 0;

    int x_min = INT_MAX, y_min = INT_MAX, x_max = INT_MIN, y_max = INT_MIN;
    double offset = 0;

    for (size_t i = 0; i < gids.size (); ++i) {
        const auto gid = gids [i];
        const auto& glyph = glyphs [gid];

        const auto dx = int (std::lround (offset));
        offset += metrics [gid].advance;

        if (glyph.size () < 10)
            continue;

        std::set< unsigned > path;
        depth = (std::max) (depth, 1 + depth_of (glyphs, gid, path));

        x_min = (std::min) (x_min, dx + get_s16 (glyph, 2));
        y_min = (std::min) (y_min, int (get_s16 (glyph, 4)));
        x_max = (std::max) (x_max, dx + get_s16 (glyph, 6));
        y_max = (std::max) (y_max, int (get_s16 (glyph, 8)));

        append_u16 (composite, ARG_1_AND_2_ARE_WORDS | ARGS_ARE_XY_VALUES |
                    MORE_COMPONENTS);
        append_u16 (composite, uint16_t (gid));
        append_u16 (composite, uint16_t (to_s16 (dx, "component offset")));
        append_u16 (composite, 0);

        ++count;
    }

    std::string glyph;

    if (count && !position.is_zero_width ()) {
        //
        // Last component:
        //
        fofi::put_u16 (
            composite, composite.size () - 8,
            get_u16 (composite, composite.size () - 8) & ~MORE_COMPONENTS);

        append_u16 (glyph, uint16_t (-1));
        append_u16 (glyph, uint16_t (to_s16 (x_min, "x_min")));
        append_u16 (glyph, uint16_t (int16_t (y_min)));
        append_u16 (glyph, uint16_t (to_s16 (x_max, "x_max")));
        append_u16 (glyph, uint16_t (int16_t (y_max)));

        glyph += composite;
    }

    glyphs [hidden] = glyph;

    if (position.is_zero_width ()) {
        metrics [hidden] = { 0, 0 };
    }
    else {
        const auto advance = std::lround (offset);

        metrics [hidden] = {
            uint16_t ((std::min) (advance, long (USHRT_MAX))),
            int16_t (glyph.empty () ? 0 : x_min) };
    }

    const bool grown = glyphs.size () != font.num_glyphs ();

    font.set_glyphs (glyphs);
    font.set_hmetrics (metrics);

    if (font.table ("maxp").size () >= 32) {
        auto maxp = font.table ("maxp");

        fofi::put_u16 (maxp, 28, uint16_t (
                           (std::max) (size_t (get_u16 (maxp, 28)), count)));
        fofi::put_u16 (maxp, 30, uint16_t (
                           (std::max) (size_t (get_u16 (maxp, 30)), depth)));

        font.set_table ("maxp", std::move (maxp));
    }

    //
    // Glyph names no longer line up with an extended glyph set:
    //
    if (grown && font.has ("post") && font.table ("post").size () >= 32) {
        auto post = font.table ("post").substr (0, 32);
        fofi::put_u32 (post, 0, 0x00030000);

        font.set_table ("post", std::move (post));
    }

    for (const char* tag : { "hdmx", "LTSH", "DSIG" })
        font.erase_table (tag);

    return font.serialize ();
}

std::string
font_builder_t::cache_key (const attack_position_t& position) const {
    const boost::uuids::name_generator_sha1 generator (
        boost::uuids::ns::url ());

    std::string s;

    for (const auto& x : {
            path_.filename ().string (),
            to_utf8 (position.hidden),
            to_utf8 (position.visual),
            std::to_string (std::lround (position.advance)) }) {
        s += x;
        s += '\0';
    }

    return to_hex (generator (s.data (), s.size ()));
}

font_build_report_t
font_builder_t::build_fonts (const attack_plan_t& plan,
                             const fs::path& output_dir,
                             font_store_t* store) const {
    fs::create_directories (output_dir);

    font_build_report_t report;

    for (const auto& position : plan) {
        if (!position.requires_font ())
            continue;

        const auto target = output_dir / fmt::format (
            "attack_pos{}.ttf", position.index);

        try {
            const auto key = cache_key (position);

            bool cached = false;

            if (store) {
                if (const auto path = store->get (key)) {
                    try {
                        fofi::truetype_t::load (*path);

                        fs::copy_file (
                            *path, target,
                            fs::copy_options::overwrite_existing);

                        cached = true;
                    }
                    catch (const fofi::font_error& e) {
                        error (errIO, -1, "Corrupt font cache entry {}: {}",
                               path->string (), e.what ());
                    }
                    catch (const fs::filesystem_error& e) {
                        error (errIO, -1, "Cannot copy font cache entry: {}",
                               e.what ());
                    }
                }
            }

            if (!cached) {
                const auto bytes = build (position);
                publish_file (target, bytes);

                if (store) {
                    try {
                        store->put (key, bytes);
                    }
                    catch (const fs::filesystem_error& e) {
                        error (errIO, -1, "Cannot store font: {}", e.what ());
                    }
                }
            }

            report.results.push_back ({
                    position.index, position.hidden, position.visual,
                    target, cached });
        }
        catch (const glyph_lookup_error& e) {
            error (errSyntaxWarning, -1, "Position {}: {}",
                   position.index, e.what ());

            report.failures.push_back ({
                    position.index, position.hidden, e.what (), e.missing });
        }
        catch (const fofi::font_error& e) {
            error (errSyntaxWarning, -1, "Position {}: {}",
                   position.index, e.what ());

            report.failures.push_back ({
                    position.index, position.hidden, e.what () });
        }
        catch (const fs::filesystem_error& e) {
            error (errIO, -1, "Position {}: {}", position.index, e.what ());

            report.failures.push_back ({
                    position.index, position.hidden, e.what () });
        }
    }

    return report;
}

} // namespace respan::attack
