// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/skip.hh>
#include <respan/parser/character.hh>

namespace respan::parser {

template< typename Iterator >
bool skipws (Iterator, Iterator& iter, Iterator last) {
    bool b = false;

    if (iter != last && is_space (*iter)) {
        b = true;
        for (++iter; iter != last && is_space (*iter); ++iter) ;
    }

    return b;
}

template< typename Iterator >
bool skip_comment (Iterator, Iterator& iter, Iterator last) {
    if (iter != last && *iter == '%') {
        for (++iter; iter != last && *iter != '\r' && *iter != '\n'; ++iter) ;
        return true;
    }

    return false;
}

template< typename Iterator >
bool skip (Iterator first, Iterator& iter, Iterator last) {
    bool b = false;

    while (skipws (first, iter, last) || skip_comment (first, iter, last))
        b = true;

    return b;
}

} // respan::parser
