// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_ATTACK_FONT_STORE_HH
#define RESPAN_ATTACK_FONT_STORE_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <filesystem>
namespace fs = std::filesystem;

namespace respan::attack {

//
// Content-addressable store of font files:
//
struct font_store_t {
    virtual ~font_store_t () = default;

    virtual std::optional< fs::path > get (const std::string& key) const = 0;
    virtual void put (const std::string& key, const std::string& bytes) = 0;
};

//
// One `<key>.ttf' file per entry, published by renaming a complete temporary
// file so that readers never see a partial font.
//
class fs_font_store_t : public font_store_t {
public:
    explicit fs_font_store_t (fs::path);

    std::optional< fs::path > get (const std::string&) const override;
    void put (const std::string&, const std::string&) override;

    const fs::path& path () const { return dir_; }

private:
    fs::path dir_;
};

//
// Writes the file in full under a temporary name, then renames it into place:
//
void publish_file (const fs::path&, const std::string&);

} // namespace respan::attack

#endif // RESPAN_ATTACK_FONT_STORE_HH
