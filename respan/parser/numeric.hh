// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_NUMERIC_HH
#define RESPAN_RESPAN_PARSER_NUMERIC_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

template< typename Iterator >
bool bool_ (Iterator, Iterator&, Iterator, bool&);

//
// An integer, or a real if the token carries a decimal point or does not fit
// an int:
//
template< typename Iterator >
bool number (Iterator, Iterator&, Iterator, ast::obj_t&);

} // respan::parser

#include <respan/parser/numeric.cc>

#endif // RESPAN_RESPAN_PARSER_NUMERIC_HH
