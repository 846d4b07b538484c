// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <stdexcept>
#include <utility>

#include <docasm/accumulator.hh>
#include <docasm/error.hh>

namespace docasm {

void accumulator_t::accumulate (
    const block_id_t& id, block_type_t type, const std::string& text,
    const bbox_t& box) {
    auto iter = index.find (id);

    if (iter == index.end ()) {
        if (!textual (type)) {
            throw conflicting_population (fmt::format (
                "page {}: text line matched to {} block {}", page,
                name_of (type), to_string (id)));
        }

        index.emplace (id, blocks.size ());
        blocks.push_back (block_t{ type, text, box, { }, { page, page } });

        return;
    }

    auto& block = blocks [iter->second];

    if (!textual (block.type)) {
        throw conflicting_population (fmt::format (
            "page {}: text line merged into {} block {}", page,
            name_of (block.type), to_string (id)));
    }

    if (type != block.type) {
        throw conflicting_population (fmt::format (
            "page {}: {} line merged into {} block {}", page, name_of (type),
            name_of (block.type), to_string (id)));
    }

    block.text += '\n';
    block.text += text;

    block.box += box;
}

void accumulator_t::inject (
    const block_id_t& id, block_type_t type, const bbox_t& box) {
    if (textual (type)) {
        throw conflicting_population (fmt::format (
            "page {}: {} block {} must be built from text lines", page,
            name_of (type), to_string (id)));
    }

    auto iter = index.find (id);

    if (iter != index.end ()) {
        throw conflicting_population (fmt::format (
            "page {}: {} block {} already holds a {}", page, name_of (type),
            to_string (id), name_of (blocks [iter->second].type)));
    }

    index.emplace (id, blocks.size ());
    blocks.push_back (block_t{ type, { }, box, { }, { page, page } });
}

const block_t& accumulator_t::at (const block_id_t& id) const {
    auto iter = index.find (id);

    if (iter == index.end ()) {
        throw std::out_of_range ("accumulator_t::at");
    }

    return blocks [iter->second];
}

blocks_t accumulator_t::finalize () && {
    auto xs = std::move (blocks);

    blocks.clear ();
    index.clear ();

    return xs;
}

} // namespace docasm
