// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <string>

#include <pwd.h>
#include <unistd.h>
#include <sys/types.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <utils/path.hh>

namespace respan {
namespace {

const passwd* passwd_of (const std::string& user) {
    if (!user.empty ())
        return getpwnam (user.c_str ());

    return getpwuid (getuid ());
}

} // anonymous

fs::path home_path () {
    if (const char* s = getenv ("HOME"))
        return fs::path (s);

    const char* user = getenv ("USER");

    if (const auto p = passwd_of (user ? user : ""))
        return fs::path (p->pw_dir);

    return fs::path (".");
}

fs::path expand_path (const fs::path& path) {
    const auto& s = path.native ();

    if (s.empty () || s [0] != '~')
        return path;

    const auto pos = s.find ('/');
    const auto user = s.substr (1, pos == std::string::npos ? pos : pos - 1);

    fs::path home;

    if (user.empty ()) {
        home = home_path ();
    }
    else if (const auto p = passwd_of (user)) {
        home = p->pw_dir;
    }
    else {
        return path;
    }

    return pos == std::string::npos ? home : home / s.substr (pos + 1);
}

fs::path make_temp_path () {
    return make_temp_path (fs::temp_directory_path ());
}

fs::path make_temp_path (const fs::path& dir) {
    thread_local boost::uuids::random_generator gen;
    return dir / (".tmp-" + boost::uuids::to_string (gen ()));
}

} // namespace respan
