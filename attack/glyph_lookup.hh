// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_ATTACK_GLYPH_LOOKUP_HH
#define RESPAN_ATTACK_GLYPH_LOOKUP_HH

#include <defs.hh>

#include <stdexcept>
#include <string>
#include <vector>

#include <filesystem>
namespace fs = std::filesystem;

#include <ft2build.h>
#include FT_FREETYPE_H

namespace respan::attack {

//
// Characters absent from the character map of the baseline font, one entry
// per character:
//
struct glyph_lookup_error : std::runtime_error {
    explicit glyph_lookup_error (std::vector< wchar_t >);

    std::vector< wchar_t > missing;
};

//
// Character to glyph mapping and metrics of the baseline font:
//
struct glyph_lookup_t {
    virtual ~glyph_lookup_t () = default;

    virtual unsigned glyph_index (wchar_t) const = 0;

    bool has (wchar_t c) const { return glyph_index (c); }

    virtual std::string glyph_name (wchar_t) const = 0;

    //
    // Advance in font units:
    //
    virtual double glyph_width (wchar_t) const = 0;

    //
    // Throws glyph_lookup_error listing every character of the text which is
    // not mapped:
    //
    void ensure_available (const std::wstring&) const;
};

//
// FreeType backed lookup; owns its library and face.
//
class ft_glyph_lookup_t : public glyph_lookup_t {
public:
    explicit ft_glyph_lookup_t (const fs::path&);
    ~ft_glyph_lookup_t ();

    ft_glyph_lookup_t (const ft_glyph_lookup_t&) = delete;
    ft_glyph_lookup_t& operator= (const ft_glyph_lookup_t&) = delete;

    unsigned glyph_index (wchar_t) const override;

    std::string glyph_name (wchar_t) const override;

    double glyph_width (wchar_t) const override;

    unsigned units_per_em () const { return face_->units_per_EM; }

    const fs::path& path () const { return path_; }

private:
    fs::path path_;

    FT_Library library_ = 0;
    FT_Face face_ = 0;
};

} // namespace respan::attack

#endif // RESPAN_ATTACK_GLYPH_LOOKUP_HH
