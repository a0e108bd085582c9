// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_UTILS_STRING_HH
#define RESPAN_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace respan {

std::vector< std::string >
split(const std::string &s, const std::string &delims = " \t\r\n");

//
// Splits a config line into tokens, honoring single and double quotes:
//
std::vector< std::string > tokenize(const std::string &s);

std::string to_utf8(const std::wstring &);
std::string to_utf8(wchar_t);

//
// Invalid sequences decode to U+FFFD:
//
std::wstring from_utf8(const std::string &);

//
// Collapses every run of whitespace into a single space; the second form
// also yields, for each output character, the offset of its source:
//
std::wstring collapse_whitespace(const std::wstring &);
std::wstring collapse_whitespace(const std::wstring &, std::vector< size_t > &);

//
// Drops all whitespace, recording source offsets:
//
std::wstring strip_whitespace(const std::wstring &, std::vector< size_t > &);

inline bool is_space(wchar_t c)
{
    switch (c) {
    case L' ': case L'\t': case L'\n': case L'\r': case L'\f': case L'\v':
    case 0x85: case 0xA0: case 0x1680: case 0x2028: case 0x2029:
    case 0x202F: case 0x205F: case 0x3000:
        return true;

    default:
        return 0x2000 <= c && c <= 0x200A;
    }
}

} // namespace respan

#endif // RESPAN_UTILS_STRING_HH
