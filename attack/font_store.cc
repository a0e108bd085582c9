// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <fstream>
#include <system_error>

#include <attack/font_store.hh>

#include <utils/path.hh>

namespace respan::attack {

void publish_file (const fs::path& target, const std::string& bytes) {
    const auto tmp = make_temp_path (target.parent_path ().empty ()
        ? fs::path (".") : target.parent_path ());

    {
        std::ofstream out (tmp, std::ios::binary);
        out.write (bytes.data (), std::streamsize (bytes.size ()));

        if (!out.flush ()) {
            std::error_code ignore;
            fs::remove (tmp, ignore);

            throw fs::filesystem_error (
                "cannot write", tmp, std::make_error_code (std::errc::io_error));
        }
    }

    std::error_code ec;
    fs::rename (tmp, target, ec);

    if (ec) {
        std::error_code ignore;
        fs::remove (tmp, ignore);

        throw fs::filesystem_error ("cannot publish", tmp, target, ec);
    }
}

fs_font_store_t::fs_font_store_t (fs::path dir) : dir_ (std::move (dir)) {
    fs::create_directories (dir_);
}

std::optional< fs::path >
fs_font_store_t::get (const std::string& key) const {
    const auto path = dir_ / (key + ".ttf");

    std::error_code ec;

    if (fs::is_regular_file (path, ec))
        return path;

    return { };
}

void fs_font_store_t::put (const std::string& key, const std::string& bytes) {
    const auto path = dir_ / (key + ".ttf");

    std::error_code ec;

    if (fs::exists (path, ec))
        return;

    publish_file (path, bytes);
}

} // namespace respan::attack
