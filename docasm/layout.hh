// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_LAYOUT_HH
#define DOCASM_DOCASM_LAYOUT_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <docasm/bbox.hh>
#include <docasm/identifier.hh>
#include <docasm/label.hh>

namespace docasm {

//
// One layout detector output, read-only to the assembler:
//
struct layout_region_t {
    block_id_t id;
    label_t label;
    bbox_t box;
};

using layout_regions_t = std::vector< layout_region_t >;

struct word_t {
    std::string value;
    bbox_t box;
};

//
// One recognized line of text, as a sequence of words in reading order:
//
struct text_line_t {
    std::vector< word_t > words;
};

using text_lines_t = std::vector< text_line_t >;

struct page_dimensions_t {
    int height, width;
};

//
// Detections for one page. Regions come in the detector's own order, which
// decides between regions that overlap a line equally well:
//
struct page_t {
    std::optional< page_dimensions_t > dimensions;

    text_lines_t lines;
    layout_regions_t regions;
};

using pages_t = std::vector< page_t >;

//
// Union of the word boxes; throws empty_line for a line without words and
// invalid_geometry for a malformed word box:
//
bbox_t box_of (const text_line_t&);

//
// Word values separated by a single space:
//
std::string render (const text_line_t&);

//
// Throws invalid_geometry if the region box is malformed:
//
void validate (const layout_region_t&);

} // namespace docasm

#endif // DOCASM_DOCASM_LAYOUT_HH
