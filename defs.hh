// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef DOCASM_DEFS_HH
#define DOCASM_DEFS_HH

#include <config.hh>

#include <boost/assert.hpp>

#define DOCASM_ASSERT BOOST_ASSERT

#endif // DOCASM_DEFS_HH
