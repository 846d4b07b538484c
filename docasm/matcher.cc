// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <docasm/matcher.hh>

#include <range/v3/algorithm/find_if.hpp>

namespace docasm {

double coverage_of (const bbox_t& line, const bbox_t& region) {
    const auto area = area_of (line);

    if (area <= 0) {
        return 0;
    }

    return intersection_area_of (line, region) / area;
}

match_t match (
    const bbox_t& box, const layout_regions_t& regions, id_generator_t& gen,
    double threshold) {
    auto iter = ranges::find_if (regions, [&](auto& region) {
        return coverage_of (box, region.box) > threshold;
    });

    if (iter == regions.end ()) {
        return { gen (), block_type_t::undefined };
    }

    return { iter->id, block_type_of (iter->label) };
}

} // namespace docasm
