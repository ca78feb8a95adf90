// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFDRAW_DEFS_HH
#define PDFDRAW_DEFS_HH

#include <config.hh>

#define TO_S(x) #x

#define PDFDRAW_DO_CAT(a, b) a ## b
#define PDFDRAW_CAT(a, b) PDFDRAW_DO_CAT(a, b)

#include <boost/assert.hpp>

#define PDFDRAW_ASSERT BOOST_ASSERT
#define ASSERT PDFDRAW_ASSERT

#endif // PDFDRAW_DEFS_HH
