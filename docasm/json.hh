// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_JSON_HH
#define DOCASM_DOCASM_JSON_HH

#include <defs.hh>

#include <istream>
#include <optional>
#include <string>

#include <docasm/block.hh>
#include <docasm/document.hh>
#include <docasm/layout.hh>

#include <nlohmann/json.hpp>

namespace docasm {

//
// Detections for a whole document, as produced by the detection pipeline:
//
//   { "detection_origin": "doctr", "metadata": { ... },
//     "pages": [ {
//       "dimensions": [ height, width ],
//       "regions": [
//         { "id": "<uuid>", "label": 10, "bbox": [[x0, y0], [x1, y1]] } ],
//       "lines": [ { "words": [
//         { "value": "Hello", "geometry": [[x0, y0], [x1, y1]] } ] } ]
//     } ] }
//
// Labels are detector indices or label names, region ids are optional,
// metadata values are strings.
//
struct input_t {
    pages_t pages;
    metadata_t metadata;
    std::optional< std::string > detection_origin;
};

//
// Throw format_error on malformed input; geometry is checked later, by the
// assembler:
//
input_t parse_input (const nlohmann::json&);
input_t parse_input (std::istream&);

nlohmann::json to_json (const bbox_t&);
nlohmann::json to_json (const block_t&);
nlohmann::json to_json (const document_t&);

// Indented document JSON, with invalid UTF-8 replaced by U+FFFD:
std::string serialize (const document_t&);

} // namespace docasm

#endif // DOCASM_DOCASM_JSON_HH
