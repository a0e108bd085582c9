// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_ERROR_HH
#define RESPAN_RESPAN_PARSER_ERROR_HH

#include <defs.hh>

#include <string>

namespace respan::parser {

//
// Formats a diagnostic of the form:
//
//   error:<line>:<col>: parsing <what> at offset <n>:
//   [...]<context>
//   --------------^
//
template< typename Iterator >
std::string expected (Iterator, Iterator, Iterator, const std::string&);

template< typename Iterator >
inline std::string
expected (Iterator first, Iterator iter, Iterator last, char what) {
    return expected (first, iter, last, std::string (1U, what));
}

} // respan::parser

#include <respan/parser/error.cc>

#endif // RESPAN_RESPAN_PARSER_ERROR_HH
