// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_UTILS_PARSEARGS_HH
#define RESPAN_UTILS_PARSEARGS_HH

#include <defs.hh>

#include <string>
#include <variant>
#include <vector>

namespace respan {

//
// A command line switch and the place its value goes; a `bool' target
// makes it a flag, the others take the following argument:
//
struct arg_desc_t {
    const char* arg;
    std::variant< bool*, int*, double*, std::string* > value;
    const char* usage;
};

using arg_descs_t = std::vector< arg_desc_t >;

//
// Removes the recognized switches, and their values, from argv; stops at,
// and removes, the first `--'. Returns false if a value is missing or
// malformed.
//
bool parse_args (const arg_descs_t&, int& argc, char* argv []);

void print_usage (const char* program, const char* other_args,
                  const arg_descs_t&);

bool is_int (const char*);
bool is_fp (const char*);

} // namespace respan

#endif // RESPAN_UTILS_PARSEARGS_HH
