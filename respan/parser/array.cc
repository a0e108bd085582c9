// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/any.hh>
#include <respan/parser/array.hh>
#include <respan/parser/iterator_guard.hh>
#include <respan/parser/lit.hh>
#include <respan/parser/skip.hh>

namespace respan::parser {

template< typename Iterator >
bool array (Iterator first, Iterator& iter, Iterator last,
            ast::array_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    ast::array_t arr;

    if (lit (first, iter, last, '[')) {
        skip (first, iter, last);

        bool closed = false;

        while (iter != last) {
            if (lit (first, iter, last, ']')) {
                closed = true;
                break;
            }

            ast::obj_t obj;

            if (!any (first, iter, last, obj))
                return false;

            arr.emplace_back (std::move (obj));
            skip (first, iter, last);
        }

        if (!closed)
            return false;

        attr = std::move (arr);
        RESPAN_PARSE_SUCCESS;
    }

    return false;
}

} // respan::parser
