// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef RESPAN_DEFS_HH
#define RESPAN_DEFS_HH

#include <config.hh>

#define TO_S(x) #x

#define RESPAN_DO_CAT(a, b) a ## b
#define RESPAN_CAT(a, b) RESPAN_DO_CAT(a, b)

#include <boost/assert.hpp>

#define RESPAN_ASSERT BOOST_ASSERT
#define ASSERT RESPAN_ASSERT

#endif // RESPAN_DEFS_HH
