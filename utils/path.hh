// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_UTILS_PATH_HH
#define RESPAN_UTILS_PATH_HH

#include <defs.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace respan {

// Get home directory path.
fs::path home_path ();

// Expand a leading `~' or `~user'; on failure, return the path unchanged.
fs::path expand_path (const fs::path&);

// A fresh, randomly named path under the system temporary directory, or
// under the given directory.
fs::path make_temp_path ();
fs::path make_temp_path (const fs::path&);

} // namespace respan

#endif // RESPAN_UTILS_PATH_HH
