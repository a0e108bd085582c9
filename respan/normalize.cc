// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <respan/normalize.hh>
#include <utils/string.hh>

namespace respan {

bool is_zero_width (wchar_t c) {
    switch (c) {
    case 0x200B: case 0x200C: case 0x200D:
    case 0x2060: case 0x2061: case 0x2062: case 0x2063:
    case 0xFEFF:
        return true;

    default:
        return false;
    }
}

bool is_combining (wchar_t c) {
    return
        (0x0300 <= c && c <= 0x036F) ||
        (0x1AB0 <= c && c <= 0x1AFF) ||
        (0x1DC0 <= c && c <= 0x1DFF) ||
        (0x20D0 <= c && c <= 0x20FF) ||
        (0xFE20 <= c && c <= 0xFE2F);
}

const wchar_t* ligature_expansion (wchar_t c) {
    switch (c) {
    case 0x000B: case 0xFB00: return L"ff";
    case 0x000C: case 0xFB01: return L"fi";
    case 0x000D: case 0xFB02: return L"fl";
    case 0x000E: case 0xFB03: return L"ffi";
    case 0x000F: case 0xFB04: return L"ffl";
    case 0xFB05: case 0xFB06: return L"st";

    default:
        return 0;
    }
}

std::wstring expand_text (const std::wstring& s) {
    std::wstring result;
    result.reserve (s.size ());

    for (auto c : s) {
        if (is_zero_width (c))
            continue;

        if (const auto p = ligature_expansion (c))
            result += p;
        else
            result += c;
    }

    return result;
}

std::wstring normalize_text (const std::wstring& s) {
    return collapse_whitespace (expand_text (s));
}

std::wstring
normalize_text (const std::wstring& s, std::vector< size_t >& offsets) {
    std::wstring result;
    result.reserve (s.size ());

    offsets.clear ();
    offsets.reserve (s.size () + 1);

    bool space = false;

    for (auto c : s) {
        offsets.push_back (result.size ());

        if (is_zero_width (c))
            continue;

        //
        // Some ligature codes are also white-space control codes:
        //
        if (const auto p = ligature_expansion (c)) {
            result += p;
            space = false;
        }
        else if (is_space (c)) {
            if (!space)
                result += L' ';

            space = true;
        }
        else {
            result += c;
            space = false;
        }
    }

    offsets.push_back (result.size ());

    return result;
}

std::wstring compact_text (const std::wstring& s) {
    std::vector< size_t > ignore;
    return strip_whitespace (expand_text (s), ignore);
}

} // namespace respan
