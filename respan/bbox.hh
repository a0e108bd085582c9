// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RESPAN_RESPAN_BBOX_HH
#define RESPAN_RESPAN_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace respan {
namespace detail {

template< typename T >
struct point_t {
    using value_type = T;
    value_type x, y;
};

template< typename T >
inline bool
operator== (const point_t< T >& lhs, const point_t< T >& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

template< typename T >
inline T dot (const point_t< T >& lhs, const point_t< T >& rhs) {
    return lhs.x * rhs.x + lhs.y * rhs.y;
}

//
// Unit vector along the argument; degenerate vectors default to the
// horizontal, left-to-right, direction:
//
template< typename T >
inline point_t< T > unit_of (point_t< T > x, T epsilon = T (1e-6)) {
    const auto length = std::hypot (x.x, x.y);

    if (length <= epsilon) {
        return { T (1), T (0) };
    }

    return { x.x / length, x.y / length };
}

//
// Bounding box, described by 4 coordinates of two points, a `bottom-left' and a
// `top-right' (if (0,0) is at bottom-left), or `top-left' and `bottom-right'
// (when (0,0) is at top-left):
//
template< typename T >
struct bbox_t {
    using value_type = T;
    using point_type = point_t< T >;

    union {
        value_type arr [4];
        point_type point [2];
    };
};

template< typename T >
inline bool
operator== (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return std::equal (
        lhs.arr, lhs.arr + sizeof lhs.arr / sizeof *lhs.arr, rhs.arr);
}

template< typename T >
inline bool
operator!= (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return !(lhs == rhs);
}

template< typename T >
inline bbox_t< T >
operator+ (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return {
        (std::min) (lhs.arr [0], rhs.arr [0]),
        (std::min) (lhs.arr [1], rhs.arr [1]),
        (std::max) (lhs.arr [2], rhs.arr [2]),
        (std::max) (lhs.arr [3], rhs.arr [3])
    };
}

template< typename T >
inline bbox_t< T >&
operator+= (bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    return lhs = lhs + rhs;
}

template< typename T >
inline std::ostream&
operator<< (std::ostream& ss, const bbox_t< T >& box) {
    return ss
        << box.arr [0] << ","
        << box.arr [1] << ","
        << box.arr [2] << ","
        << box.arr [3];
}

////////////////////////////////////////////////////////////////////////

template< typename T >
inline bbox_t< T >
normalize (bbox_t< T > x) {
    if (x.arr [0] > x.arr [2]) { std::swap (x.arr [0], x.arr [2]); }
    if (x.arr [1] > x.arr [3]) { std::swap (x.arr [1], x.arr [3]); }
    return x;
}

template< typename T >
inline T width_of (const bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

//
// Minimum and maximum projection of the four corners onto a unit vector:
//
template< typename T >
inline std::pair< T, T >
project (const bbox_t< T >& x, const point_t< T >& unit) {
    const point_t< T > corners [] = {
        { x.arr [0], x.arr [1] }, { x.arr [2], x.arr [1] },
        { x.arr [0], x.arr [3] }, { x.arr [2], x.arr [3] }
    };

    T lo = dot (corners [0], unit), hi = lo;

    for (const auto& p : corners) {
        const auto value = dot (p, unit);
        lo = (std::min) (lo, value);
        hi = (std::max) (hi, value);
    }

    return { lo, hi };
}

//
// Splits a box along the x axis into n equal parts, returning the i-th:
//
template< typename T >
inline bbox_t< T >
horizontal_part (const bbox_t< T >& x, size_t i, size_t n) {
    const auto w = width_of (x) / n;
    return { x.arr [0] + i * w, x.arr [1], x.arr [0] + (i + 1) * w, x.arr [3] };
}

} // namespace detail

using point_t = detail::point_t< double >;
using bbox_t = detail::bbox_t< double >;

} // namespace respan

#endif // RESPAN_RESPAN_BBOX_HH
