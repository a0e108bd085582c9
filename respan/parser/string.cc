// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <respan/parser/string.hh>
#include <respan/parser/character.hh>
#include <respan/parser/iterator_guard.hh>

#include <iterator>

namespace respan::parser {

template< typename Iterator >
bool string_ (Iterator, Iterator& iter, Iterator last, ast::string_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    if (iter == last || *iter != '(')
        return false;

    std::string s;

    size_t depth = 1;

    for (++iter; iter != last; ++iter) {
        switch (const char c = *iter) {
        case '(':
            ++depth;
            s += c;
            break;

        case ')':
            if (0 == --depth) {
                ++iter;
                attr = ast::string_t (std::move (s));
                RESPAN_PARSE_SUCCESS;
            }

            s += c;
            break;

        case '\r':
            //
            // An unescaped end-of-line is a single newline:
            //
            if (std::next (iter) != last && *std::next (iter) == '\n')
                ++iter;

            s += '\n';
            break;

        case '\\': {
            if (++iter == last)
                return false;

            switch (const char x = *iter) {
            case 'n': s += '\n'; break;
            case 'r': s += '\r'; break;
            case 't': s += '\t'; break;
            case 'b': s += '\b'; break;
            case 'f': s += '\f'; break;

            case '\r':
                // line continuation
                if (std::next (iter) != last && *std::next (iter) == '\n')
                    ++iter;
                break;

            case '\n':
                break;

            case '0': case '1': case '2': case '3':
            case '4': case '5': case '6': case '7': {
                int value = x - '0';

                for (size_t i = 1; i < 3; ++i) {
                    auto next = std::next (iter);

                    if (next == last || *next < '0' || *next > '7')
                        break;

                    value = (value << 3) + (*next - '0');
                    iter = next;
                }

                s += char (value & 0xFF);
            }
                break;

            default:
                // includes \(, \) and \\
                s += x;
                break;
            }
        }
            break;

        default:
            s += c;
            break;
        }
    }

    return false;
}

template< typename Iterator >
bool
angular_string (Iterator, Iterator& iter, Iterator last, ast::string_t& attr) {
    RESPAN_ITERATOR_GUARD (iter);

    if (iter == last || *iter != '<')
        return false;

    std::string s;

    int hi = -1;

    for (++iter; iter != last; ++iter) {
        if (*iter == '>') {
            if (hi >= 0)
                s += char (hi << 4);

            ++iter;

            attr = ast::string_t (std::move (s), true);
            RESPAN_PARSE_SUCCESS;
        }

        if (is_space (*iter))
            continue;

        const int x = hex_value (*iter);

        if (x < 0)
            return false;

        if (hi < 0) {
            hi = x;
        }
        else {
            s += char ((hi << 4) | x);
            hi = -1;
        }
    }

    return false;
}

} // respan::parser
