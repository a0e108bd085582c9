// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_CHARACTER_HH
#define RESPAN_RESPAN_PARSER_CHARACTER_HH

#include <defs.hh>

namespace respan::parser {

//
// PDF character classes: 0 regular, 1 delimiter, 2 white-space.
//
inline int ctype_of (char c) {
    switch (c) {
    case '\0': case '\t': case '\n': case '\f': case '\r': case ' ':
        return 2;

    case '(': case ')': case '<': case '>': case '[': case ']':
    case '{': case '}': case '/': case '%':
        return 1;

    default:
        return 0;
    }
}

inline bool is_regular (char c) {
    return 0 == ctype_of (c);
}

inline bool is_delimiter (char c) {
    return 1 == ctype_of (c);
}

inline bool is_space (char c) {
    return 2 == ctype_of (c);
}

inline int hex_value (char c) {
    if ('0' <= c && c <= '9') return c - '0';
    if ('a' <= c && c <= 'f') return c - 'a' + 10;
    if ('A' <= c && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // respan::parser

#endif // RESPAN_RESPAN_PARSER_CHARACTER_HH
