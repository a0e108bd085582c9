// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_NAME_HH
#define RESPAN_RESPAN_PARSER_NAME_HH

#include <defs.hh>

#include <respan/parser/ast.hh>

namespace respan::parser {

template< typename Iterator >
bool name (Iterator, Iterator&, Iterator, ast::name_t&);

} // respan::parser

#include <respan/parser/name.cc>

#endif // RESPAN_RESPAN_PARSER_NAME_HH
