// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_BLOCK_HH
#define DOCASM_DOCASM_BLOCK_HH

#include <defs.hh>

#include <cstddef>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <docasm/bbox.hh>
#include <docasm/label.hh>

namespace docasm {

using metadata_t = std::map< std::string, std::string >;

//
// Inclusive range of page indices spanned by a block:
//
struct page_range_t {
    size_t first, last;
};

inline bool
operator== (const page_range_t& lhs, const page_range_t& rhs) {
    return lhs.first == rhs.first && lhs.last == rhs.last;
}

//
// One unit of the assembled document. The type tag selects the kind of block;
// image and table blocks have empty text:
//
struct block_t {
    block_type_t type;

    std::string text;

    //
    // Union of the boxes of all contributing lines, or the region box for
    // injected blocks:
    //
    bbox_t box;

    metadata_t metadata;
    page_range_t pages;
};

using blocks_t = std::vector< block_t >;

inline std::ostream&
operator<< (std::ostream& ss, const block_t& block) {
    return ss
        << name_of (block.type) << " [" << block.box << "] p"
        << block.pages.first << "-" << block.pages.last
        << " \"" << block.text << "\"";
}

} // namespace docasm

#endif // DOCASM_DOCASM_BLOCK_HH
