// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef DOCASM_DOCASM_BBOX_HH
#define DOCASM_DOCASM_BBOX_HH

#include <defs.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <type_traits>

namespace docasm {
namespace detail {

template< typename > struct bbox_t;

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

//
// Bounding box, described by the 4 coordinates of a `top-left' and a
// `bottom-right' point, with (0,0) at the top-left corner of the page and y
// growing downwards:
//
template< typename T >
struct bbox_t {
    using value_type = T;
    using point_type = point_t< T >;

    union {
        value_type arr [4];
        point_type point [2];
    };

    const point_type& top_left ()     const { return point [0]; }
    const point_type& bottom_right () const { return point [1]; }
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

//
// Union of two boxes, i.e., the smallest box containing both:
//
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
inline T width_of (const bbox_t< T >& x) { return x.arr [2] - x.arr [0]; }

template< typename T >
inline T height_of (const bbox_t< T >& x) { return x.arr [3] - x.arr [1]; }

//
// A box is well-formed if its coordinates and its area are finite and its
// corners are ordered; zero width or height is allowed:
//
template< typename T >
inline bool
valid (const bbox_t< T >& x) {
    if (!(x.arr [0] <= x.arr [2] && x.arr [1] <= x.arr [3]))
        return false;

    if constexpr (std::is_floating_point_v< T >) {
        auto finite = [](T t) { return std::isfinite (t); };

        if (!std::all_of (x.arr, x.arr + 4, finite))
            return false;

        return std::isfinite (width_of (x) * height_of (x));
    }

    return true;
}

template< typename T >
inline T
area_of (const bbox_t< T >& x) {
    DOCASM_ASSERT (valid (x));
    return width_of (x) * height_of (x);
}

template< typename T >
inline T
horizontal_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [2], rhs.arr [2]) -
        (std::max) (lhs.arr [0], rhs.arr [0]);
    return dist > 0 ? dist : 0;
}

template< typename T >
inline T
vertical_overlap (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    const auto dist =
        (std::min) (lhs.arr [3], rhs.arr [3]) -
        (std::max) (lhs.arr [1], rhs.arr [1]);
    return dist > 0 ? dist : 0;
}

//
// Area of the clipped intersection, zero for disjoint or touching boxes:
//
template< typename T >
inline T
intersection_area_of (const bbox_t< T >& lhs, const bbox_t< T >& rhs) {
    DOCASM_ASSERT (valid (lhs) && valid (rhs));
    return horizontal_overlap (lhs, rhs) * vertical_overlap (lhs, rhs);
}

} // namespace detail

////////////////////////////////////////////////////////////////////////

//
// The default bounding box type is the floating point specialization for
// double:
//
using bbox_t  = detail::bbox_t< double >;
using point_t = detail::point_t< double >;

} // namespace docasm

#endif // DOCASM_DOCASM_BBOX_HH
