// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <string>
#include <vector>

#include <utils/string.hh>

namespace respan {

std::vector< std::string >
split(const std::string &s, const std::string &delims)
{
    std::vector< std::string > xs;

    for (size_t first = 0, second; first < s.size(); first = second + 1) {
        second = s.find_first_of(delims, first);

        if (first != second)
            xs.emplace_back(s.substr(first, second - first));

        if (second == std::string::npos)
            break;
    }

    return xs;
}

std::vector< std::string > tokenize(const std::string &s)
{
    std::vector< std::string > xs;

    auto iter = s.begin(), last = s.end();

    while (iter != last) {
        for (; iter != last && isspace(*iter); ++iter) ;

        if (iter == last)
            break;

        auto next = iter;

        if (*iter == '"' || *iter == '\'') {
            const char quote = *iter++;
            for (next = iter; next != last && *next != quote; ++next) ;
        }
        else {
            for (++next; next != last && !isspace(*next); ++next) ;
        }

        xs.emplace_back(iter, next);
        iter = next == last ? next : next + 1;
    }

    return xs;
}

std::string to_utf8(wchar_t c)
{
    std::string s;

    const auto u = static_cast< unsigned long >(c);

    if (u < 0x80) {
        s += char(u);
    } else if (u < 0x800) {
        s += char(0xC0 | (u >> 6));
        s += char(0x80 | (u & 0x3F));
    } else if (u < 0x10000) {
        s += char(0xE0 | (u >> 12));
        s += char(0x80 | ((u >> 6) & 0x3F));
        s += char(0x80 | (u & 0x3F));
    } else if (u < 0x110000) {
        s += char(0xF0 | (u >> 18));
        s += char(0x80 | ((u >> 12) & 0x3F));
        s += char(0x80 | ((u >> 6) & 0x3F));
        s += char(0x80 | (u & 0x3F));
    } else {
        s += "\xEF\xBF\xBD";
    }

    return s;
}

std::string to_utf8(const std::wstring &ws)
{
    std::string s;
    s.reserve(ws.size());

    for (auto c : ws)
        s += to_utf8(c);

    return s;
}

std::wstring from_utf8(const std::string &s)
{
    std::wstring ws;
    ws.reserve(s.size());

    for (size_t i = 0, n = s.size(); i < n;) {
        const auto c = static_cast< unsigned char >(s[i]);

        size_t len;
        unsigned long u;

        if (c < 0x80) {
            len = 1, u = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2, u = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3, u = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4, u = c & 0x07;
        } else {
            ws += wchar_t(0xFFFD), ++i;
            continue;
        }

        if (i + len > n) {
            ws += wchar_t(0xFFFD);
            break;
        }

        bool ok = true;

        for (size_t j = 1; j < len; ++j) {
            const auto x = static_cast< unsigned char >(s[i + j]);

            if ((x & 0xC0) != 0x80) {
                ok = false;
                break;
            }

            u = (u << 6) | (x & 0x3F);
        }

        ws += ok ? wchar_t(u) : wchar_t(0xFFFD);
        i += ok ? len : 1;
    }

    return ws;
}

std::wstring
collapse_whitespace(const std::wstring &s, std::vector< size_t > &offsets)
{
    std::wstring result;
    result.reserve(s.size());

    offsets.clear();

    bool space = false;

    for (size_t i = 0; i < s.size(); ++i) {
        if (is_space(s[i])) {
            if (!space) {
                result += L' ';
                offsets.push_back(i);
            }

            space = true;
        } else {
            result += s[i];
            offsets.push_back(i);
            space = false;
        }
    }

    return result;
}

std::wstring collapse_whitespace(const std::wstring &s)
{
    std::vector< size_t > ignore;
    return collapse_whitespace(s, ignore);
}

std::wstring
strip_whitespace(const std::wstring &s, std::vector< size_t > &offsets)
{
    std::wstring result;
    result.reserve(s.size());

    offsets.clear();

    for (size_t i = 0; i < s.size(); ++i) {
        if (!is_space(s[i])) {
            result += s[i];
            offsets.push_back(i);
        }
    }

    return result;
}

} // namespace respan
