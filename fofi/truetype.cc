// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <fofi/truetype.hh>

#include <algorithm>
#include <climits>
#include <exception>

#include <boost/endian/conversion.hpp>
namespace endian = boost::endian;

#include <boost/iostreams/device/mapped_file.hpp>
namespace io = boost::iostreams;

namespace respan::fofi {

namespace detail {

inline const unsigned char* bytes_of (const std::string& s, size_t off) {
    return reinterpret_cast< const unsigned char* > (s.data ()) + off;
}

inline unsigned char* bytes_of (std::string& s, size_t off) {
    return reinterpret_cast< unsigned char* > (s.data ()) + off;
}

inline void check_range (const std::string& s, size_t off, size_t n) {
    if (off > s.size () || s.size () - off < n)
        throw font_error ("read past the end of a font table");
}

//
// Table directory entry:
//
struct entry_t {
    std::string tag;
    uint32_t checksum, offset, length;
};

inline size_t padded (size_t n) { return (n + 3) & ~size_t (3); }

} // namespace detail

uint16_t get_u16 (const std::string& s, size_t off) {
    detail::check_range (s, off, 2);
    return endian::load_big_u16 (detail::bytes_of (s, off));
}

int16_t get_s16 (const std::string& s, size_t off) {
    return int16_t (get_u16 (s, off));
}

uint32_t get_u32 (const std::string& s, size_t off) {
    detail::check_range (s, off, 4);
    return endian::load_big_u32 (detail::bytes_of (s, off));
}

void put_u16 (std::string& s, size_t off, uint16_t x) {
    detail::check_range (s, off, 2);
    endian::store_big_u16 (detail::bytes_of (s, off), x);
}

void put_u32 (std::string& s, size_t off, uint32_t x) {
    detail::check_range (s, off, 4);
    endian::store_big_u32 (detail::bytes_of (s, off), x);
}

void append_u16 (std::string& s, uint16_t x) {
    s.resize (s.size () + 2);
    put_u16 (s, s.size () - 2, x);
}

void append_u32 (std::string& s, uint32_t x) {
    s.resize (s.size () + 4);
    put_u32 (s, s.size () - 4, x);
}

uint32_t checksum_of (const char* pbuf, size_t n) {
    const auto p = reinterpret_cast< const unsigned char* > (pbuf);

    uint32_t sum = 0;

    for (size_t i = 0; i < n; i += 4) {
        uint32_t x = 0;

        for (size_t j = 0; j < 4; ++j)
            x = x << 8 | (i + j < n ? p [i + j] : 0);

        sum += x;
    }

    return sum;
}

////////////////////////////////////////////////////////////////////////

truetype_t truetype_t::load (const fs::path& filepath) {
    io::mapped_file_source src;

    try {
        src.open (filepath.string ());
    }
    catch (const std::exception& e) {
        throw font_error (filepath.string () + ": " + e.what ());
    }

    return parse (src.data (), src.size ());
}

truetype_t truetype_t::parse (const char* pbuf, size_t n) {
    const std::string buf (pbuf, n);

    truetype_t font;

    font.version_ = get_u32 (buf, 0);

    if (font.version_ != 0x00010000 && font.version_ != 0x74727565) {
        throw font_error ("not a TrueType font");
    }

    const auto count = get_u16 (buf, 4);

    for (size_t i = 0; i < count; ++i) {
        const size_t off = 12 + 16 * i;

        detail::check_range (buf, off, 16);

        const auto tag = buf.substr (off, 4);
        const auto offset = get_u32 (buf, off + 8);
        const auto length = get_u32 (buf, off + 12);

        if (offset > n || n - offset < length)
            throw font_error ("table '" + tag + "' extends past the end");

        font.tables_ [tag] = buf.substr (offset, length);
    }

    for (const char* tag : { "head", "hhea", "maxp" }) {
        if (!font.has (tag))
            throw font_error (std::string ("missing '") + tag + "' table");
    }

    return font;
}

const std::string& truetype_t::table (const std::string& tag) const {
    auto iter = tables_.find (tag);

    if (iter == tables_.end ())
        throw font_error ("missing '" + tag + "' table");

    return iter->second;
}

void truetype_t::set_table (const std::string& tag, std::string data) {
    tables_ [tag] = std::move (data);
}

void truetype_t::erase_table (const std::string& tag) {
    tables_.erase (tag);
}

uint16_t truetype_t::units_per_em () const {
    return get_u16 (table ("head"), 18);
}

uint16_t truetype_t::num_glyphs () const {
    return get_u16 (table ("maxp"), 4);
}

std::vector< std::string > truetype_t::glyphs () const {
    const auto& loca = table ("loca");
    const auto& glyf = table ("glyf");

    const bool long_format = get_s16 (table ("head"), 50);

    const size_t n = num_glyphs ();

    auto offset_of = [&](size_t i) -> size_t {
        return long_format ? get_u32 (loca, 4 * i) : 2 * get_u16 (loca, 2 * i);
    };

    std::vector< std::string > xs;
    xs.reserve (n);

    for (size_t i = 0, off = offset_of (0); i < n; ++i) {
        const auto next = offset_of (i + 1);

        if (next < off || next > glyf.size ())
            throw font_error ("bad 'loca' entry for glyph " + std::to_string (i));

        xs.push_back (glyf.substr (off, next - off));
        off = next;
    }

    return xs;
}

void truetype_t::set_glyphs (const std::vector< std::string >& xs) {
    if (xs.size () > USHRT_MAX)
        throw font_error ("too many glyphs");

    std::string glyf, loca;

    int16_t x0 = SHRT_MAX, y0 = SHRT_MAX, x1 = SHRT_MIN, y1 = SHRT_MIN;

    for (const auto& x : xs) {
        append_u32 (loca, uint32_t (glyf.size ()));

        if (x.size () >= 10) {
            x0 = (std::min) (x0, get_s16 (x, 2));
            y0 = (std::min) (y0, get_s16 (x, 4));
            x1 = (std::max) (x1, get_s16 (x, 6));
            y1 = (std::max) (y1, get_s16 (x, 8));
        }

        glyf += x;
        glyf.resize (detail::padded (glyf.size ()));
    }

    append_u32 (loca, uint32_t (glyf.size ()));

    auto& head = tables_ ["head"];

    put_u16 (head, 50, 1);

    if (x0 <= x1) {
        put_u16 (head, 36, uint16_t (x0));
        put_u16 (head, 38, uint16_t (y0));
        put_u16 (head, 40, uint16_t (x1));
        put_u16 (head, 42, uint16_t (y1));
    }

    put_u16 (tables_ ["maxp"], 4, uint16_t (xs.size ()));

    tables_ ["glyf"] = std::move (glyf);
    tables_ ["loca"] = std::move (loca);
}

std::vector< hmetric_t > truetype_t::hmetrics () const {
    const auto& hmtx = table ("hmtx");

    const size_t n = num_glyphs ();
    const size_t m = get_u16 (table ("hhea"), 34);

    if (0 == m || m > n)
        throw font_error ("bad numberOfHMetrics");

    std::vector< hmetric_t > xs;
    xs.reserve (n);

    for (size_t i = 0; i < m; ++i)
        xs.push_back ({ get_u16 (hmtx, 4 * i), get_s16 (hmtx, 4 * i + 2) });

    for (size_t i = m; i < n; ++i) {
        xs.push_back ({
                xs.back ().advance, get_s16 (hmtx, 4 * m + 2 * (i - m)) });
    }

    return xs;
}

void truetype_t::set_hmetrics (const std::vector< hmetric_t >& xs) {
    std::string hmtx;

    uint16_t max_advance = 0;

    for (const auto& x : xs) {
        append_u16 (hmtx, x.advance);
        append_u16 (hmtx, uint16_t (x.lsb));

        max_advance = (std::max) (max_advance, x.advance);
    }

    auto& hhea = tables_ ["hhea"];

    put_u16 (hhea, 10, max_advance);
    put_u16 (hhea, 34, uint16_t (xs.size ()));

    tables_ ["hmtx"] = std::move (hmtx);
}

std::string truetype_t::serialize () const {
    const size_t n = tables_.size ();

    uint16_t search_range = 1, entry_selector = 0;

    for (; search_range * 2 <= n; search_range *= 2)
        ++entry_selector;

    search_range *= 16;

    std::string buf;

    append_u32 (buf, version_);
    append_u16 (buf, uint16_t (n));
    append_u16 (buf, search_range);
    append_u16 (buf, entry_selector);
    append_u16 (buf, uint16_t (n * 16 - search_range));

    std::vector< detail::entry_t > entries;

    size_t offset = 12 + 16 * n, head_offset = 0;

    for (const auto& [tag, data] : tables_) {
        auto copy = data;

        if (tag == "head") {
            put_u32 (copy, 8, 0);
            head_offset = offset;
        }

        entries.push_back ({
                tag, checksum_of (copy.data (), copy.size ()),
                uint32_t (offset), uint32_t (copy.size ()) });

        offset += detail::padded (copy.size ());
    }

    for (const auto& x : entries) {
        buf += x.tag;

        append_u32 (buf, x.checksum);
        append_u32 (buf, x.offset);
        append_u32 (buf, x.length);
    }

    for (const auto& [tag, data] : tables_) {
        buf += data;
        buf.resize (detail::padded (buf.size ()));

        if (tag == "head")
            put_u32 (buf, head_offset + 8, 0);
    }

    put_u32 (buf, head_offset + 8,
             0xB1B0AFBA - checksum_of (buf.data (), buf.size ()));

    return buf;
}

} // namespace respan::fofi
