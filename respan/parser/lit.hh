// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_LIT_HH
#define RESPAN_RESPAN_PARSER_LIT_HH

#include <defs.hh>

#include <string>

namespace respan::parser {

template< typename Iterator >
bool lit (Iterator, Iterator&, Iterator, const std::string&);

template< typename Iterator >
bool lit (Iterator, Iterator&, Iterator, char);

//
// Matches a keyword, requiring it not be followed by a regular character:
//
template< typename Iterator >
bool keyword (Iterator, Iterator&, Iterator, const std::string&);

} // respan::parser

#include <respan/parser/lit.cc>

#endif // RESPAN_RESPAN_PARSER_LIT_HH
