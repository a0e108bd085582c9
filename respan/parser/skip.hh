// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_SKIP_HH
#define RESPAN_RESPAN_PARSER_SKIP_HH

#include <defs.hh>

namespace respan::parser {

template< typename Iterator >
bool skipws (Iterator, Iterator&, Iterator);

template< typename Iterator >
bool skip_comment (Iterator, Iterator&, Iterator);

//
// White-space and comments, in any order:
//
template< typename Iterator >
bool skip (Iterator, Iterator&, Iterator);

} // respan::parser

#include <respan/parser/skip.cc>

#endif // RESPAN_RESPAN_PARSER_SKIP_HH
