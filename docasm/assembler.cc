// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iterator>
#include <set>
#include <utility>
#include <vector>

#include <docasm/accumulator.hh>
#include <docasm/assembler.hh>
#include <docasm/error.hh>
#include <docasm/matcher.hh>

#include <range/v3/functional/comparisons.hpp>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/algorithm/stable_sort.hpp>
#include <range/v3/algorithm/transform.hpp>
#include <range/v3/view/filter.hpp>

namespace docasm {
namespace {

//
// Run `f', prefixing the message of a geometry error with the location of the
// offending item:
//
template< typename F >
auto at_item (size_t page, const char* what, size_t i, F f) {
    auto where = [&](const std::exception& e) {
        return fmt::format ("page {}, {} {}: {}", page, what, i, e.what ());
    };

    try {
        return f ();
    }
    catch (const empty_line& e) {
        throw empty_line (where (e));
    }
    catch (const invalid_geometry& e) {
        throw invalid_geometry (where (e));
    }
}

inline double top_of (const block_t& block) {
    return block.box.top_left ().y;
}

} // anonymous

blocks_t assembler_t::assemble (const page_t& page, size_t index) const {
    const auto& regions = page.regions;

    std::set< block_id_t > ids;

    for (size_t i = 0; i < regions.size (); ++i) {
        at_item (index, "region", i, [&]() { validate (regions [i]); });

        if (!ids.insert (regions [i].id).second) {
            throw conflicting_population (fmt::format (
                "page {}, region {}: identifier {} already names another "
                "region", index, i, to_string (regions [i].id)));
        }
    }

    id_generator_t gen;
    accumulator_t accumulator (index);

    size_t absorbed = 0;

    for (size_t i = 0; i < page.lines.size (); ++i) {
        const auto& line = page.lines [i];

        const auto box = at_item (index, "line", i, [&]() {
            return box_of (line);
        });

        const auto [ id, type ] = match (
            box, regions, gen, params.overlap_threshold);

        if (!textual (type)) {
            //
            // The line lies within an image or table, which is emitted as a
            // whole below:
            //
            ++absorbed;
            continue;
        }

        accumulator.accumulate (id, type, render (line), box);
    }

    const auto text_blocks = accumulator.size ();

    ranges::for_each (
        regions | ranges::views::filter ([](auto& region) {
            return standalone (region.label);
        }),
        [&](auto& region) {
            accumulator.inject (
                gen (), block_type_of (region.label), region.box);
        });

    auto blocks = std::move (accumulator).finalize ();
    ranges::stable_sort (blocks, ranges::less{ }, top_of);

    debug (
        "page {}: {} lines, {} regions -> {} text blocks, {} image/table "
        "blocks, {} lines absorbed", index, page.lines.size (), regions.size (),
        text_blocks, blocks.size () - text_blocks, absorbed);

    return blocks;
}

document_t
assembler_t::assemble (const pages_t& pages, metadata_t metadata) const {
    const auto n = pages.size ();

    std::vector< blocks_t > results (n);
    std::vector< std::exception_ptr > errors (n);

    //
    // Each page is assembled by exactly one worker, into its own slot:
    //
    std::atomic< size_t > next{ 0 };

    auto work = [&]() {
        for (size_t i; (i = next++) < n; ) {
            try {
                results [i] = assemble (pages [i], i);
            }
            catch (const std::exception&) {
                errors [i] = std::current_exception ();
            }
        }
    };

    const auto workers = (std::min) (params.workers, n);

    if (workers > 1) {
        std::vector< std::future< void > > futures;

        for (size_t i = 0; i < workers; ++i) {
            futures.push_back (std::async (std::launch::async, work));
        }

        ranges::for_each (futures, [](auto& f) { f.get (); });
    }
    else {
        work ();
    }

    auto iter = std::find_if (errors.begin (), errors.end (), [](auto& p) {
        return bool (p);
    });

    if (iter != errors.end ()) {
        std::rethrow_exception (*iter);
    }

    document_t doc{
        std::move (metadata), { }, { }, params.detection_origin
    };

    for (auto& blocks : results) {
        std::move (
            blocks.begin (), blocks.end (), std::back_inserter (doc.content));
    }

    ranges::transform (
        pages, std::back_inserter (doc.dimensions), &page_t::dimensions);

    return doc;
}

} // namespace docasm
