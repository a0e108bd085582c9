// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/any.hh>
#include <respan/parser/character.hh>
#include <respan/parser/content.hh>
#include <respan/parser/iterator_guard.hh>
#include <respan/parser/lit.hh>
#include <respan/parser/name.hh>
#include <respan/parser/skip.hh>

#include <iterator>
#include <memory>

namespace respan::parser {

template< typename Iterator >
bool
operator_name (Iterator, Iterator& iter, Iterator last, std::string& attr) {
    std::string s;

    for (; iter != last && is_regular (*iter); ++iter)
        s += *iter;

    if (s.empty ())
        return false;

    return attr = std::move (s), true;
}

template< typename Iterator >
bool
inline_image (Iterator first, Iterator& iter, Iterator last,
              ast::operator_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    auto dict = std::make_shared< ast::dict_t > ();

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        if (keyword (first, iter, last, "ID"))
            break;

        ast::name_t key;

        if (!name (first, iter, last, key))
            return false;

        skip (first, iter, last);

        ast::obj_t value;

        if (!any (first, iter, last, value))
            return false;

        dict->emplace_back (std::move (key), std::move (value));
    }

    //
    // A single white-space character separates `ID' from the data:
    //
    if (iter == last || !is_space (*iter))
        return false;

    const auto data = ++iter;

    //
    // Data ends at the first `EI' preceded and followed by white-space:
    //
    for (; iter != last; ++iter) {
        if (*iter != 'E' || !is_space (*std::prev (iter)))
            continue;

        auto next = iter;

        if (lit (first, next, last, "EI") &&
            (next == last || is_space (*next) || is_delimiter (*next))) {
            attr.operands.clear ();
            attr.operands.emplace_back (std::move (dict));
            attr.name = "BI";
            attr.data.assign (data, iter == data ? iter : std::prev (iter));

            iter = next;
            RESPAN_PARSE_SUCCESS;
        }
    }

    return false;
}

template< typename Iterator >
bool
content (Iterator first, Iterator& iter, Iterator last,
         std::vector< ast::operator_t >& attr) {
    std::vector< ast::operator_t > xs;
    std::vector< ast::obj_t > operands;

    for (skip (first, iter, last); iter != last; skip (first, iter, last)) {
        ast::obj_t obj;

        if (any (first, iter, last, obj)) {
            operands.emplace_back (std::move (obj));
            continue;
        }

        std::string op;

        if (!operator_name (first, iter, last, op))
            return false;

        if (op == "BI") {
            ast::operator_t image;

            if (!inline_image (first, iter, last, image))
                return false;

            xs.emplace_back (std::move (image));
            operands.clear ();

            continue;
        }

        xs.push_back (ast::operator_t{ std::move (operands), std::move (op) });
        operands.clear ();
    }

    //
    // Trailing operands without an operator are dropped, as renderers do:
    //
    attr = std::move (xs);
    return true;
}

} // respan::parser
