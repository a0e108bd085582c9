// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <string>
#include <stdexcept>

#include <respan/Error.hh>
#include <respan/content_stream.hh>
#include <respan/parser/character.hh>
#include <respan/parser/content.hh>
#include <respan/parser/error.hh>

#include <fmt/format.h>

namespace respan {
namespace ast = parser::ast;

namespace {

//
// Shortest text which reads back as the same value, without an exponent:
//
std::string write_real (double value) {
    if (value == std::floor (value) && std::fabs (value) < 1e9) {
        return fmt::format ("{}", (long long)value);
    }

    auto s = fmt::format ("{}", value);

    if (const auto pos = s.find_first_of ("eE"); pos != std::string::npos) {
        const auto dot = s.find ('.');

        const int digits = dot < pos ? int (pos - dot - 1) : 0;
        const int exponent = std::stoi (s.substr (pos + 1));

        s = fmt::format ("{:.{}f}", value, (std::max) (0, digits - exponent));
    }

    if (s.find ('.') != std::string::npos) {
        s.erase (s.find_last_not_of ('0') + 1);

        if (s.back () == '.')
            s.pop_back ();
    }

    if (s == "-0")
        s = "0";

    return s;
}

std::string write_name (const std::string& s) {
    std::string result = "/";

    for (unsigned char c : s) {
        if (c < 0x21 || c > 0x7E || c == '#' || !parser::is_regular (c))
            result += fmt::format ("#{:02X}", c);
        else
            result += char (c);
    }

    return result;
}

std::string write_string (const ast::string_t& s) {
    std::string result;

    if (s.hex) {
        result = "<";

        for (unsigned char c : s)
            result += fmt::format ("{:02X}", c);

        return result += ">";
    }

    result = "(";

    for (unsigned char c : s) {
        switch (c) {
        case '(': result += "\\("; break;
        case ')': result += "\\)"; break;
        case '\\': result += "\\\\"; break;
        case '\n': result += "\\n"; break;
        case '\r': result += "\\r"; break;
        case '\t': result += "\\t"; break;
        case '\b': result += "\\b"; break;
        case '\f': result += "\\f"; break;

        default:
            if (c < 0x20 || c > 0x7E)
                result += fmt::format ("\\{:03o}", c);
            else
                result += char (c);
            break;
        }
    }

    return result += ")";
}

struct object_writer_t {
    std::string operator() (const ast::null_t&) const { return "null"; }
    std::string operator() (bool b) const { return b ? "true" : "false"; }
    std::string operator() (int n) const { return fmt::format ("{}", n); }
    std::string operator() (double d) const { return write_real (d); }

    std::string operator() (const ast::name_t& s) const {
        return write_name (s);
    }

    std::string operator() (const ast::string_t& s) const {
        return write_string (s);
    }

    std::string operator() (const ast::array_pointer& p) const {
        std::string s = "[";

        for (const auto& x : *p) {
            if (s.size () > 1)
                s += ' ';

            s += write_object (x);
        }

        return s += "]";
    }

    std::string operator() (const ast::dict_pointer& p) const {
        std::string s = "<<";

        for (const auto& [key, value] : *p) {
            s += write_name (key);
            s += ' ';
            s += write_object (value);
        }

        return s += ">>";
    }
};

} // anonymous

std::string write_object (const ast::obj_t& obj) {
    return std::visit (object_writer_t{ }, obj);
}

operators_t parse_content_stream (std::string_view buf) {
    operators_t xs;

    auto first = buf.begin (), iter = first, last = buf.end ();

    if (!parser::content (first, iter, last, xs)) {
        const auto pos = std::distance (first, iter);
        const auto msg = parser::expected (first, iter, last, "content stream");

        error (errSyntaxError, pos, "Malformed content stream:\n{}", msg);
        throw std::runtime_error ("malformed content stream");
    }

    return xs;
}

std::string write_content_stream (const operators_t& xs) {
    std::string s;

    for (const auto& op : xs) {
        if (op.name == "BI") {
            s += "BI";

            if (!op.operands.empty () &&
                std::holds_alternative< ast::dict_pointer > (op.operands [0])) {
                for (const auto& [key, value] :
                         *std::get< ast::dict_pointer > (op.operands [0])) {
                    s += ' ';
                    s += write_name (key);
                    s += ' ';
                    s += write_object (value);
                }
            }

            s += " ID ";
            s += op.data;
            s += "\nEI\n";

            continue;
        }

        for (const auto& operand : op.operands) {
            s += write_object (operand);
            s += ' ';
        }

        s += op.name;
        s += '\n';
    }

    return s;
}

} // namespace respan
