// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_ANY_HH
#define RESPAN_RESPAN_PARSER_ANY_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

//
// Any operand object:
//
template< typename Iterator >
bool any (Iterator, Iterator&, Iterator, ast::obj_t&);

} // respan::parser

#include <respan/parser/any.cc>

#endif // RESPAN_RESPAN_PARSER_ANY_HH
