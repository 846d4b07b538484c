// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_ACCUMULATOR_HH
#define DOCASM_DOCASM_ACCUMULATOR_HH

#include <defs.hh>

#include <cstddef>
#include <map>
#include <string>

#include <docasm/bbox.hh>
#include <docasm/block.hh>
#include <docasm/identifier.hh>
#include <docasm/label.hh>

namespace docasm {

//
// In-progress blocks of one page, keyed by block identifier. Owned by a
// single worker; lines must be fed in detection order since merged text is
// concatenated in the order of the calls:
//
struct accumulator_t {
    explicit accumulator_t (size_t page) : page (page) { }

    accumulator_t (const accumulator_t&) = delete;
    accumulator_t& operator= (const accumulator_t&) = delete;

    accumulator_t (accumulator_t&&) = default;
    accumulator_t& operator= (accumulator_t&&) = default;

    //
    // Start a block of the given type with the line, or append the line to
    // the block already holding `id' and grow its box. Only text-bearing
    // block types are accepted:
    //
    void accumulate (
        const block_id_t&, block_type_t, const std::string&, const bbox_t&);

    //
    // Add an image or table block for a layout region. The identifier must
    // not be in use:
    //
    void inject (const block_id_t&, block_type_t, const bbox_t&);

    bool contains (const block_id_t& id) const {
        return index.find (id) != index.end ();
    }

    const block_t& at (const block_id_t&) const;

    size_t size () const { return blocks.size (); }
    bool empty () const { return blocks.empty (); }

    //
    // Release the blocks in order of creation; the accumulator is left empty:
    //
    blocks_t finalize () &&;

private:
    size_t page;

    blocks_t blocks;
    std::map< block_id_t, size_t > index;
};

} // namespace docasm

#endif // DOCASM_DOCASM_ACCUMULATOR_HH
