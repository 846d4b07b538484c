// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_LABEL_HH
#define DOCASM_DOCASM_LABEL_HH

#include <defs.hh>

#include <iostream>
#include <string>
#include <string_view>

namespace docasm {

//
// Layout detector classes, in the order of the detector's output indices:
//
enum struct label_t {
    caption,
    footnote,
    formula,
    list_item,
    page_footer,
    page_header,
    picture,
    section_header,
    table,
    text,
    title
};

inline constexpr int label_count = int (label_t::title) + 1;

//
// Kinds of document blocks:
//
enum struct block_type_t {
    text,
    title,
    subtitle,
    header,
    footer,
    caption,
    list_element,
    table,
    image,
    undefined
};

//
// Convert a detector output index or a canonical label name; throws
// invalid_label for anything else:
//
label_t label_of (int);
label_t label_of (std::string_view);

block_type_t block_type_of (label_t);

const char* name_of (label_t);
const char* name_of (block_type_t);

inline std::ostream& operator<< (std::ostream& ss, label_t label) {
    return ss << name_of (label);
}

inline std::ostream& operator<< (std::ostream& ss, block_type_t type) {
    return ss << name_of (type);
}

//
// Image and table blocks carry no text and are never built out of lines:
//
inline bool textual (block_type_t type) {
    return type != block_type_t::image && type != block_type_t::table;
}

//
// Layout regions that are emitted as blocks in their own right:
//
inline bool standalone (label_t label) {
    return !textual (block_type_of (label));
}

} // namespace docasm

#endif // DOCASM_DOCASM_LABEL_HH
