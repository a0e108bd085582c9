// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_CONTENT_HH
#define RESPAN_RESPAN_PARSER_CONTENT_HH

#include <defs.hh>

#include <vector>

#include <respan/parser/ast.hh>

namespace respan::parser {

//
// Operator keyword, a run of regular characters:
//
template< typename Iterator >
bool operator_name (Iterator, Iterator&, Iterator, std::string&);

//
// Inline image dictionary and payload, following the `BI' operator:
//
template< typename Iterator >
bool inline_image (Iterator, Iterator&, Iterator, ast::operator_t&);

//
// A whole content stream; on failure, `iter' points at the offending input:
//
template< typename Iterator >
bool content (Iterator, Iterator&, Iterator, std::vector< ast::operator_t >&);

} // respan::parser

#include <respan/parser/content.cc>

#endif // RESPAN_RESPAN_PARSER_CONTENT_HH
