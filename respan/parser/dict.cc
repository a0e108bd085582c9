// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/any.hh>
#include <respan/parser/dict.hh>
#include <respan/parser/iterator_guard.hh>
#include <respan/parser/lit.hh>
#include <respan/parser/name.hh>
#include <respan/parser/skip.hh>

namespace respan::parser {

template< typename Iterator >
bool dictionary (Iterator first, Iterator& iter, Iterator last,
                 ast::dict_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    if (!lit (first, iter, last, "<<"))
        return false;

    ast::dict_t dict;

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        if (lit (first, iter, last, ">>")) {
            attr = std::move (dict);
            RESPAN_PARSE_SUCCESS;
        }

        ast::name_t key;

        if (!name (first, iter, last, key))
            return false;

        skip (first, iter, last);

        ast::obj_t value;

        if (!any (first, iter, last, value))
            return false;

        dict.emplace_back (std::move (key), std::move (value));
    }

    return false;
}

} // respan::parser
