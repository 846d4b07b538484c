// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <docasm/error.hh>
#include <docasm/label.hh>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/iterator.hpp>

namespace docasm {
namespace {

auto named (std::string_view s) {
    return [=](const char* name) { return s == name; };
}

const char* label_names [label_count] = {
    "caption",
    "footnote",
    "formula",
    "list-item",
    "page-footer",
    "page-header",
    "picture",
    "section-header",
    "table",
    "text",
    "title"
};

const block_type_t block_types [label_count] = {
    block_type_t::caption,
    block_type_t::text,
    block_type_t::text,
    block_type_t::list_element,
    block_type_t::footer,
    block_type_t::header,
    block_type_t::image,
    block_type_t::subtitle,
    block_type_t::table,
    block_type_t::text,
    block_type_t::title
};

const char* block_type_names [] = {
    "TextBlock",
    "TitleBlock",
    "SubTitleBlock",
    "HeaderBlock",
    "FooterBlock",
    "CaptionBlock",
    "ListElementBlock",
    "TableBlock",
    "ImageBlock",
    "UndefinedBlock"
};

} // anonymous

label_t label_of (int index) {
    if (index < 0 || index >= label_count) {
        throw invalid_label (
            fmt::format ("layout label index {} out of range", index));
    }

    return label_t (index);
}

label_t label_of (std::string_view s) {
    auto iter = ranges::find_if (label_names, named (s));

    if (iter == ranges::end (label_names)) {
        throw invalid_label (fmt::format ("unknown layout label \"{}\"", s));
    }

    return label_t (ranges::distance (ranges::begin (label_names), iter));
}

block_type_t block_type_of (label_t label) {
    return block_types [int (label)];
}

const char* name_of (label_t label) {
    return label_names [int (label)];
}

const char* name_of (block_type_t type) {
    return block_type_names [int (type)];
}

} // namespace docasm
