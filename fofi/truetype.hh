// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_FOFI_TRUETYPE_HH
#define RESPAN_FOFI_TRUETYPE_HH

#include <defs.hh>

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

namespace respan::fofi {

struct font_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

//
// Big-endian accessors over table data; reads past the end throw:
//
uint16_t get_u16 (const std::string&, size_t);
 int16_t get_s16 (const std::string&, size_t);
uint32_t get_u32 (const std::string&, size_t);

void put_u16 (std::string&, size_t, uint16_t);
void put_u32 (std::string&, size_t, uint32_t);

void append_u16 (std::string&, uint16_t);
void append_u32 (std::string&, uint32_t);

uint32_t checksum_of (const char*, size_t);

struct hmetric_t {
    uint16_t advance;
    int16_t lsb;
};

//
// An sfnt with TrueType outlines, as a set of named tables. Glyph data and
// horizontal metrics are exposed per glyph; everything else is kept as raw
// table bytes.
//
class truetype_t {
public:
    static truetype_t load (const fs::path&);
    static truetype_t parse (const char*, size_t);

    bool has (const std::string& tag) const {
        return tables_.count (tag);
    }

    const std::string& table (const std::string&) const;

    void set_table (const std::string&, std::string);
    void erase_table (const std::string&);

    uint16_t units_per_em () const;
    uint16_t num_glyphs () const;

    //
    // Glyph descriptions, one per glyph, as found in `glyf':
    //
    std::vector< std::string > glyphs () const;

    //
    // Replaces `glyf' and rewrites `loca' in the long format, updating the
    // glyph count and the font bounding box:
    //
    void set_glyphs (const std::vector< std::string >&);

    //
    // One entry per glyph, the trailing left side bearings expanded:
    //
    std::vector< hmetric_t > hmetrics () const;

    //
    // Writes a full `hmtx', one long metric per glyph:
    //
    void set_hmetrics (const std::vector< hmetric_t >&);

    //
    // The font file, with table checksums and head.checkSumAdjustment
    // recomputed:
    //
    std::string serialize () const;

private:
    uint32_t version_ = 0x00010000;
    std::map< std::string, std::string > tables_;
};

} // namespace respan::fofi

#endif // RESPAN_FOFI_TRUETYPE_HH
