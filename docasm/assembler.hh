// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_ASSEMBLER_HH
#define DOCASM_DOCASM_ASSEMBLER_HH

#include <defs.hh>

#include <cstddef>

#include <docasm/block.hh>
#include <docasm/document.hh>
#include <docasm/layout.hh>
#include <docasm/params.hh>

namespace docasm {

//
// Reconciles text lines with layout regions into typed blocks:
// - every line goes to the block of the first region covering enough of it, or
//   to a block of its own, and lines of the same region are merged,
// - every image and table region becomes one block,
// - the blocks of a page are put in reading order (top edge, top to bottom).
//
struct assembler_t {
    assembler_t () = default;
    explicit assembler_t (const params_t& params) : params (params) { }

    //
    // Blocks of one page, in reading order. Throws a subclass of
    // assembly_error naming the page and the offending line or region:
    //
    blocks_t assemble (const page_t&, size_t index) const;

    //
    // The whole document. Pages are assembled by `params.workers' threads and
    // concatenated in page order; an error on any page fails the document, the
    // error for the lowest such page being reported:
    //
    document_t assemble (const pages_t&, metadata_t = { }) const;

private:
    params_t params;
};

} // namespace docasm

#endif // DOCASM_DOCASM_ASSEMBLER_HH
