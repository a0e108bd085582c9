// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef RESPAN_RESPAN_PARSER_AST_HH
#define RESPAN_RESPAN_PARSER_AST_HH

#include <defs.hh>

#include <memory>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace respan::parser::ast {

struct null_t { };

//
// Names are kept decoded, without the leading solidus:
//
struct name_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    name_t () = default;

    name_t (const base_type& arg) : base_type (arg) { }
    name_t (base_type&& arg) : base_type (std::move (arg)) { }
};

//
// String bytes, after escape processing; `hex' remembers the <...> syntax:
//
struct string_t : std::string {
    using base_type = std::string;
    using base_type::base_type;
    using base_type::operator=;

    string_t () = default;

    string_t (const base_type& arg, bool hex = false)
        : base_type (arg), hex (hex) { }

    string_t (base_type&& arg, bool hex = false)
        : base_type (std::move (arg)), hex (hex) { }

    bool hex = false;
};

struct array_t;
struct  dict_t;

using array_pointer = std::shared_ptr< array_t >;
using  dict_pointer = std::shared_ptr<  dict_t >;

using obj_t = std::variant<
    null_t, bool, int, double, name_t, string_t, array_pointer, dict_pointer
    >;

#define RESPAN_PARSER_AST_DEF(type, ...)                        \
struct type : __VA_ARGS__ {                                     \
    using base_type = __VA_ARGS__;                              \
                                                                \
    using base_type::base_type;                                 \
    using base_type::operator=;                                 \
                                                                \
    type () = default;                                          \
                                                                \
    type (const base_type& arg) : base_type (arg) { }           \
    type (base_type&& arg) : base_type (std::move (arg)) { }    \
}

RESPAN_PARSER_AST_DEF (array_t, std::vector< obj_t >);
RESPAN_PARSER_AST_DEF ( dict_t, std::vector< std::tuple< name_t, obj_t > >);

#undef RESPAN_PARSER_AST_DEF

//
// One content stream instruction; inline images carry their binary payload
// in `data':
//
struct operator_t {
    std::vector< obj_t > operands;
    std::string name;
    std::string data;
};

inline bool is_number (const obj_t& obj) {
    return std::holds_alternative< int > (obj) ||
        std::holds_alternative< double > (obj);
}

inline double as_number (const obj_t& obj, double value = 0) {
    if (std::holds_alternative< int > (obj))
        return std::get< int > (obj);

    if (std::holds_alternative< double > (obj))
        return std::get< double > (obj);

    return value;
}

} // namespace respan::parser::ast

#endif // RESPAN_RESPAN_PARSER_AST_HH
