// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_CONTENT_STREAM_HH
#define RESPAN_RESPAN_CONTENT_STREAM_HH

#include <defs.hh>

#include <string>
#include <string_view>
#include <vector>

#include <respan/parser/ast.hh>

namespace respan {

using operator_t = parser::ast::operator_t;
using operators_t = std::vector< operator_t >;

//
// Tokenizes a (decoded) page content stream into its operators; throws
// std::runtime_error on malformed input.
//
operators_t parse_content_stream (std::string_view);

//
// Writes operators back out, one per line:
//
std::string write_content_stream (const operators_t&);

std::string write_object (const parser::ast::obj_t&);

} // namespace respan

#endif // RESPAN_RESPAN_CONTENT_STREAM_HH
