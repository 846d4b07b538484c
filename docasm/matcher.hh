// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_MATCHER_HH
#define DOCASM_DOCASM_MATCHER_HH

#include <defs.hh>

#include <docasm/bbox.hh>
#include <docasm/identifier.hh>
#include <docasm/label.hh>
#include <docasm/layout.hh>

namespace docasm {

struct match_t {
    block_id_t id;
    block_type_t type;
};

//
// Fraction of the line box covered by the region box. Not symmetric: a small
// line well inside a large region scores 1. Zero for degenerate line boxes:
//
double coverage_of (const bbox_t& line, const bbox_t& region);

//
// Find the region for a line: the first region, in the given order, covering
// more than `threshold' of the line box. Lines without such a region get a
// fresh identifier and the undefined block type. Region boxes must be valid:
//
match_t match (
    const bbox_t&, const layout_regions_t&, id_generator_t&,
    double threshold = DOCASM_OVERLAP_THRESHOLD);

} // namespace docasm

#endif // DOCASM_DOCASM_MATCHER_HH
