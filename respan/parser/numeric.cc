// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/lit.hh>
#include <respan/parser/numeric.hh>
#include <respan/parser/iterator_guard.hh>

#include <cctype>
#include <climits>
#include <cstdlib>
#include <string>

namespace respan::parser {

template< typename Iterator >
bool bool_ (Iterator first, Iterator& iter, Iterator last, bool& b) {
    if (iter != last) {
        switch (*iter) {
        case 't':
            if (keyword (first, iter, last, "true"))
                return b = true;
            break;

        case 'f':
            if (keyword (first, iter, last, "false"))
                return !(b = false);
            break;

        default:
            break;
        }
    }

    return false;
}

template< typename Iterator >
bool number (Iterator, Iterator& iter, Iterator last, ast::obj_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    std::string s;

    //
    // Consume sign, if any:
    //
    if (iter != last && (*iter == '+' || *iter == '-')) {
        s += *iter++;
    }

    bool empty = true, real = false;

    for (; iter != last && std::isdigit (*iter); ++iter, empty = false) {
        s += *iter;
    }

    if (iter != last && *iter == '.') {
        s += *iter++;
        real = true;

        for (; iter != last && std::isdigit (*iter); ++iter, empty = false) {
            s += *iter;
        }
    }

    if (empty) {
        return false;
    }

    if (!real) {
        const auto value = std::strtoll (s.c_str (), 0, 10);

        if (INT_MIN <= value && value <= INT_MAX) {
            attr = int (value);
            RESPAN_PARSE_SUCCESS;
        }
    }

    attr = std::strtod (s.c_str (), 0);
    RESPAN_PARSE_SUCCESS;
}

} // respan::parser
