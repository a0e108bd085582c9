// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_ARRAY_HH
#define RESPAN_RESPAN_PARSER_ARRAY_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

template< typename Iterator >
bool array (Iterator, Iterator&, Iterator, ast::array_t&);

} // respan::parser

#include <respan/parser/array.cc>

#endif // RESPAN_RESPAN_PARSER_ARRAY_HH
