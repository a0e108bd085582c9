// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_STRING_HH
#define RESPAN_RESPAN_PARSER_STRING_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

//
// Parenthesized, literal string:
//
template< typename Iterator >
bool string_ (Iterator, Iterator&, Iterator, ast::string_t&);

//
// Hexadecimal string, in angular brackets:
//
template< typename Iterator >
bool angular_string (Iterator, Iterator&, Iterator, ast::string_t&);

} // respan::parser

#include <respan/parser/string.cc>

#endif // RESPAN_RESPAN_PARSER_STRING_HH
