// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_DOCUMENT_HH
#define DOCASM_DOCASM_DOCUMENT_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <docasm/block.hh>
#include <docasm/layout.hh>

namespace docasm {

//
// Blocks of all pages, in page order and, within a page, in reading order:
//
struct document_t {
    metadata_t metadata;
    blocks_t content;

    //
    // Raster dimensions of each page, when known; not used for assembly:
    //
    std::vector< std::optional< page_dimensions_t > > dimensions;

    //
    // The pipeline which produced the text detections:
    //
    std::string detection_origin;
};

} // namespace docasm

#endif // DOCASM_DOCASM_DOCUMENT_HH
