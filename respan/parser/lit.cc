// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/lit.hh>
#include <respan/parser/character.hh>
#include <respan/parser/iterator_guard.hh>

namespace respan::parser {

template< typename Iterator >
bool lit (Iterator, Iterator& iter, Iterator last, const std::string& s) {
    RESPAN_ITERATOR_GUARD (iter);

    auto other = s.begin ();

    for (; iter != last && other != s.end () && *iter == *other;
         ++iter, ++other) ;

    if (other == s.end ()) {
        RESPAN_PARSE_SUCCESS;
    }

    return false;
}

template< typename Iterator >
bool lit (Iterator, Iterator& iter, Iterator last, char c) {
    if (iter != last && *iter == c) {
        return ++iter, true;
    }

    return false;
}

template< typename Iterator >
bool keyword (Iterator first, Iterator& iter, Iterator last,
              const std::string& s) {
    RESPAN_ITERATOR_GUARD (iter);

    if (lit (first, iter, last, s) && (iter == last || !is_regular (*iter))) {
        RESPAN_PARSE_SUCCESS;
    }

    return false;
}

} // respan::parser
