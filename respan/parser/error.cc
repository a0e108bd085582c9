// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <respan/parser/error.hh>

#include <algorithm>
#include <cctype>
#include <iterator>

#include <fmt/format.h>

namespace respan::parser {
namespace detail {

template< typename Iterator >
std::string printable (Iterator first, Iterator last) {
    std::string s;

    for (; first != last; ++first) {
        const unsigned char c = *first;

        if (std::isprint (c))
            s += char (c);
        else
            s += fmt::format ("\\{:03o}", c);
    }

    return s;
}

} // namespace detail

template< typename Iterator >
std::string
expected (Iterator first, Iterator iter, Iterator last,
          const std::string& what) {
    const auto offset = std::distance (first, iter);
    const auto line = std::count (first, iter, '\n') + 1;

    const auto bol = std::find (
        std::make_reverse_iterator (iter),
        std::make_reverse_iterator (first), '\n').base ();

    const auto col = std::distance (bol, iter) + 1;

    //
    // Up to 24 characters of context before the failure point, and up to
    // 16 after it, all from the same line:
    //
    auto from = bol;

    if (std::distance (from, iter) > 24)
        from = std::prev (iter, 24);

    auto to = iter;

    for (size_t i = 0; i < 16 && to != last && *to != '\n'; ++to, ++i) ;

    const auto before = detail::printable (from, iter);
    const auto after = detail::printable (iter, to);

    return fmt::format (
        "error:{}:{}: parsing {} at offset {}:\n{}{}{}\n{}^",
        line, col, what, offset, from == bol ? "" : "[...]", before, after,
        std::string ((from == bol ? 0 : 5) + before.size (), '-'));
}

} // respan::parser
