// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/any.hh>
#include <respan/parser/array.hh>
#include <respan/parser/dict.hh>
#include <respan/parser/lit.hh>
#include <respan/parser/name.hh>
#include <respan/parser/numeric.hh>
#include <respan/parser/string.hh>

#include <memory>

namespace respan::parser {

template< typename Iterator >
bool any (Iterator first, Iterator& iter, Iterator last, ast::obj_t& attr) {
    if (iter != last) {
        switch (*iter) {
        case '(': {
            ast::string_t s;

            if (string_ (first, iter, last, s))
                return attr = std::move (s), true;
        }
            break;

        case '<': {
            if (std::next (iter) != last && *std::next (iter) == '<') {
                ast::dict_t dict;

                if (dictionary (first, iter, last, dict))
                    return attr = std::make_shared< ast::dict_t > (
                        std::move (dict)), true;
            }
            else {
                ast::string_t s;

                if (angular_string (first, iter, last, s))
                    return attr = std::move (s), true;
            }
        }
            break;

        case '/': {
            ast::name_t s;

            if (name (first, iter, last, s))
                return attr = std::move (s), true;
        }
            break;

        case '[': {
            ast::array_t arr;

            if (array (first, iter, last, arr))
                return attr = std::make_shared< ast::array_t > (
                    std::move (arr)), true;
        }
            break;

        case 't':
        case 'f': {
            bool b;

            if (bool_ (first, iter, last, b)) {
                return attr = b, true;
            }
        }
            break;

        case 'n':
            if (keyword (first, iter, last, "null")) {
                return attr = ast::null_t { }, true;
            }

            break;

        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9':
        case '+': case '-': case '.':
            if (number (first, iter, last, attr))
                return true;

            break;

        default:
            break;
        }
    }

    return false;
}

} // respan::parser
