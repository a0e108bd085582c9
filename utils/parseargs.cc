// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <utils/parseargs.hh>

template< typename... Ts> struct overload_ : Ts... { using Ts::operator()...; };
template< typename... Ts> overload_(Ts...) -> overload_< Ts... >;

namespace respan {
namespace {

const arg_desc_t* find_arg (const arg_descs_t& args, const char* s) {
    auto iter = std::find_if (args.begin (), args.end (), [&](auto& x) {
        return 0 == strcmp (x.arg, s);
    });

    return iter == args.end () ? nullptr : &*iter;
}

//
// Stores the value of the switch at argv [i]; returns the count of
// arguments consumed and whether the value was good:
//
std::pair< int, bool >
grab_arg (const arg_desc_t& desc, int i, int argc, char* argv []) {
    const char* next = i + 1 < argc ? argv [i + 1] : nullptr;

    return std::visit (overload_ {
        [](bool* p) -> std::pair< int, bool > {
            return *p = true, std::make_pair (1, true);
        },
        [=](int* p) -> std::pair< int, bool > {
            if (next && is_int (next))
                return *p = atoi (next), std::make_pair (2, true);
            return { 1, false };
        },
        [=](double* p) -> std::pair< int, bool > {
            if (next && is_fp (next))
                return *p = atof (next), std::make_pair (2, true);
            return { 1, false };
        },
        [=](std::string* p) -> std::pair< int, bool > {
            if (next)
                return *p = next, std::make_pair (2, true);
            return { 1, false };
        }
        }, desc.value);
}

void remove_args (int& argc, char* argv [], int i, int n) {
    std::copy (argv + i + n, argv + argc, argv + i);
    argc -= n;
}

} // anonymous

bool parse_args (const arg_descs_t& args, int& argc, char* argv []) {
    bool ok = true;

    for (int i = 1; i < argc; ) {
        if (0 == strcmp (argv [i], "--")) {
            remove_args (argc, argv, i, 1);
            break;
        }

        if (const auto p = find_arg (args, argv [i])) {
            const auto [n, good] = grab_arg (*p, i, argc, argv);
            remove_args (argc, argv, i, n);
            ok = ok && good;
        }
        else {
            ++i;
        }
    }

    return ok;
}

void print_usage (const char* program, const char* other_args,
                  const arg_descs_t& args) {
    size_t w = 0;

    for (const auto& x : args)
        w = (std::max) (w, strlen (x.arg));

    fmt::print (stderr, "Usage: {} [options]", program);

    if (other_args)
        fmt::print (stderr, " {}", other_args);

    fmt::print (stderr, "\n");

    for (const auto& x : args) {
        const char* type = std::visit (overload_ {
            [](bool*)        { return ""; },
            [](int*)         { return " <int>"; },
            [](double*)      { return " <fp>"; },
            [](std::string*) { return " <string>"; }
            }, x.value);

        fmt::print (stderr, "  {:<{}}{:<10}", x.arg, w, type);

        if (x.usage)
            fmt::print (stderr, ": {}", x.usage);

        fmt::print (stderr, "\n");
    }
}

bool is_int (const char* s) {
    if (*s == '-' || *s == '+')
        ++s;

    if (!isdigit (*s))
        return false;

    while (isdigit (*s))
        ++s;

    return 0 == *s;
}

bool is_fp (const char* s) {
    if (*s == '-' || *s == '+')
        ++s;

    int n = 0;

    for (; isdigit (*s); ++s, ++n) ;

    if (*s == '.')
        ++s;

    for (; isdigit (*s); ++s, ++n) ;

    if (n > 0 && (*s == 'e' || *s == 'E')) {
        ++s;

        if (*s == '-' || *s == '+')
            ++s;

        if (!isdigit (*s))
            return false;

        while (isdigit (*s))
            ++s;
    }

    return n > 0 && 0 == *s;
}

} // namespace respan
