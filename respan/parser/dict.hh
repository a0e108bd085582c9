// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_DICT_HH
#define RESPAN_RESPAN_PARSER_DICT_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

template< typename Iterator >
bool dictionary (Iterator, Iterator&, Iterator, ast::dict_t&);

} // respan::parser

#include <respan/parser/dict.cc>

#endif // RESPAN_RESPAN_PARSER_DICT_HH
