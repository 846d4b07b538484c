// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <functional>

#include <docasm/error.hh>
#include <docasm/layout.hh>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/drop.hpp>
#include <range/v3/view/transform.hpp>

#include <fmt/ranges.h>

namespace docasm {

bbox_t box_of (const text_line_t& line) {
    const auto& words = line.words;

    if (words.empty ()) {
        throw empty_line ("text line has no word geometry");
    }

    auto iter = ranges::find_if (words, [](auto& word) {
        return !valid (word.box);
    });

    if (iter != words.end ()) {
        throw invalid_geometry (fmt::format (
            "word {} \"{}\" has a malformed box ({})",
            iter - words.begin (), iter->value,
            fmt::join (iter->box.arr, ", ")));
    }

    const auto box = ranges::accumulate (
        words | ranges::views::drop (1), words.front ().box,
        std::plus< bbox_t >{ }, &word_t::box);

    // Words far apart can still span an area too large to represent:
    if (!valid (box)) {
        throw invalid_geometry (fmt::format (
            "words span an unbounded box ({})", fmt::join (box.arr, ", ")));
    }

    return box;
}

std::string render (const text_line_t& line) {
    return fmt::format ("{}", fmt::join (
        line.words | ranges::views::transform (&word_t::value), " "));
}

void validate (const layout_region_t& region) {
    if (!valid (region.box)) {
        throw invalid_geometry (fmt::format (
            "{} region {} has a malformed box ({})", name_of (region.label),
            to_string (region.id), fmt::join (region.box.arr, ", ")));
    }
}

} // namespace docasm
