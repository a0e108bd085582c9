// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef RESPAN_RESPAN_MATRIX_HH
#define RESPAN_RESPAN_MATRIX_HH

#include <defs.hh>

#include <cmath>
#include <iostream>

#include <respan/bbox.hh>

namespace respan {

//
// PDF affine transform [a b c d e f], mapping (x, y) to
// (a x + c y + e, b x + d y + f):
//
struct matrix_t {
    double a = 1, b = 0, c = 0, d = 1, e = 0, f = 0;
};

inline matrix_t identity_matrix () { return { }; }

//
// Composition: the result applies rhs first, then lhs.
//
inline matrix_t operator* (const matrix_t& lhs, const matrix_t& rhs) {
    return {
        lhs.a * rhs.a + lhs.c * rhs.b,
        lhs.b * rhs.a + lhs.d * rhs.b,
        lhs.a * rhs.c + lhs.c * rhs.d,
        lhs.b * rhs.c + lhs.d * rhs.d,
        lhs.a * rhs.e + lhs.c * rhs.f + lhs.e,
        lhs.b * rhs.e + lhs.d * rhs.f + lhs.f
    };
}

inline matrix_t translate (const matrix_t& m, double dx, double dy) {
    return m * matrix_t{ 1, 0, 0, 1, dx, dy };
}

inline point_t transform (const matrix_t& m, const point_t& p) {
    return { m.a * p.x + m.c * p.y + m.e, m.b * p.x + m.d * p.y + m.f };
}

inline point_t translation_of (const matrix_t& m) {
    return { m.e, m.f };
}

inline bool
operator== (const matrix_t& lhs, const matrix_t& rhs) {
    return
        lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c &&
        lhs.d == rhs.d && lhs.e == rhs.e && lhs.f == rhs.f;
}

inline bool
operator!= (const matrix_t& lhs, const matrix_t& rhs) {
    return !(lhs == rhs);
}

inline bool is_identity (const matrix_t& m, double epsilon = 1e-6) {
    return
        std::fabs (m.a - 1) <= epsilon && std::fabs (m.b) <= epsilon &&
        std::fabs (m.c) <= epsilon && std::fabs (m.d - 1) <= epsilon &&
        std::fabs (m.e) <= epsilon && std::fabs (m.f) <= epsilon;
}

inline bool is_zero_translation (const matrix_t& m, double epsilon = 1e-6) {
    return std::fabs (m.e) <= epsilon && std::fabs (m.f) <= epsilon;
}

inline std::ostream&
operator<< (std::ostream& ss, const matrix_t& m) {
    return ss
        << "[" << m.a << " " << m.b << " " << m.c << " "
        << m.d << " " << m.e << " " << m.f << "]";
}

} // namespace respan

#endif // RESPAN_RESPAN_MATRIX_HH
