// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/name.hh>
#include <respan/parser/character.hh>
#include <respan/parser/iterator_guard.hh>

namespace respan::parser {

template< typename Iterator >
bool name (Iterator, Iterator& iter, Iterator last, ast::name_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    if (iter != last && *iter == '/') {
        std::string s;

        for (++iter; iter != last; ++iter) {
            if (*iter == '#') {
                int hi, lo;

                if (++iter == last || 0 > (hi = hex_value (*iter)))
                    return false;

                if (++iter == last || 0 > (lo = hex_value (*iter)))
                    return false;

                s += char ((hi << 4) | lo);
            }
            else if (is_regular (*iter)) {
                s += *iter;
            }
            else {
                break;
            }
        }

        //
        // The empty name, a lone solidus, is valid:
        //
        attr = std::move (s);
        RESPAN_PARSE_SUCCESS;
    }

    return false;
}

} // respan::parser
