// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_IDENTIFIER_HH
#define DOCASM_DOCASM_IDENTIFIER_HH

#include <defs.hh>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace docasm {

//
// Identity of a layout region, and of the block assembled for it. Only ever
// used as a key, never for ordering blocks:
//
using block_id_t = boost::uuids::uuid;

//
// Source of fresh identifiers for blocks without a layout region. Not
// thread-safe, one per page being assembled:
//
struct id_generator_t {
    block_id_t operator() () { return gen (); }

private:
    boost::uuids::random_generator gen;
};

using boost::uuids::to_string;

} // namespace docasm

#endif // DOCASM_DOCASM_IDENTIFIER_HH
