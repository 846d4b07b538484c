// -*- mode: c++ -*-
// Copyright 2020 Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE assemble

#include <defs.hh>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <docasm/assembler.hh>
#include <docasm/error.hh>
#include <docasm/identifier.hh>
#include <docasm/layout.hh>

#include <fmt/format.h>

using namespace docasm;

static text_line_t
make_line (const std::string& text, bbox_t box) {
    return text_line_t{ { word_t{ text, box } } };
}

static layout_region_t
make_region (label_t label, bbox_t box) {
    static id_generator_t gen;
    return layout_region_t{ gen (), label, box };
}

static params_t
make_params (size_t workers) {
    params_t params;
    params.workers = workers;
    return params;
}

BOOST_AUTO_TEST_SUITE(assemble)

BOOST_AUTO_TEST_CASE(title_) {
    page_t page;

    page.regions = { make_region (label_t::title, bbox_t{ 0, 0, 100, 20 }) };
    page.lines = {
        make_line ("Hello", bbox_t{ 5,  2, 95, 10 }),
        make_line ("World", bbox_t{ 5, 11, 95, 19 })
    };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 1U);

    const auto& block = blocks [0];

    BOOST_TEST (block.type == block_type_t::title);
    BOOST_TEST (block.text == "Hello\nWorld");
    BOOST_TEST (block.box == (bbox_t{ 5, 2, 95, 19 }));
    BOOST_TEST (block.metadata.empty ());
    BOOST_TEST (block.pages.first == 0U);
    BOOST_TEST (block.pages.last == 0U);
}

BOOST_AUTO_TEST_CASE(undefined_) {
    page_t page;
    page.lines = { make_line ("lonely", bbox_t{ 0, 0, 10, 10 }) };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 1U);

    BOOST_TEST (blocks [0].type == block_type_t::undefined);
    BOOST_TEST (blocks [0].text == "lonely");
    BOOST_TEST (blocks [0].box == (bbox_t{ 0, 0, 10, 10 }));
}

BOOST_AUTO_TEST_CASE(unmatched_lines_stay_apart_) {
    page_t page;
    page.lines = {
        make_line ("one", bbox_t{ 0,  0, 10, 10 }),
        make_line ("two", bbox_t{ 0, 20, 10, 30 })
    };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 2U);
    BOOST_TEST (blocks [0].text == "one");
    BOOST_TEST (blocks [1].text == "two");
}

BOOST_AUTO_TEST_CASE(words_) {
    page_t page;

    page.lines = {
        text_line_t{ {
            word_t{ "Hello", bbox_t{  0, 1, 20, 9 } },
            word_t{ "big",   bbox_t{ 22, 0, 35, 9 } },
            word_t{ "world", bbox_t{ 37, 2, 60, 10 } }
        } }
    };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 1U);
    BOOST_TEST (blocks [0].text == "Hello big world");
    BOOST_TEST (blocks [0].box == (bbox_t{ 0, 0, 60, 10 }));
}

BOOST_DATA_TEST_CASE(
    image_, data::make ({ 0, 1, 3 }), nlines) {

    page_t page;
    page.regions = { make_region (label_t::picture, bbox_t{ 0, 50, 200, 150 }) };

    for (int i = 0; i < nlines; ++i) {
        const double y = 60 + 20 * i;
        page.lines.push_back (
            make_line (fmt::format ("label {}", i), bbox_t{ 10, y, 100, y + 10 }));
    }

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 1U);

    BOOST_TEST (blocks [0].type == block_type_t::image);
    BOOST_TEST (blocks [0].text.empty ());
    BOOST_TEST (blocks [0].box == (bbox_t{ 0, 50, 200, 150 }));
}

BOOST_AUTO_TEST_CASE(table_) {
    page_t page;

    page.regions = {
        make_region (label_t::table,   bbox_t{ 0, 100, 200, 300 }),
        make_region (label_t::caption, bbox_t{ 0,  80, 200,  95 }),
        make_region (label_t::table,   bbox_t{ 0, 400, 200, 500 })
    };

    page.lines = {
        make_line ("Table 1: results", bbox_t{  5, 82, 150,  92 }),
        make_line ("cell",             bbox_t{ 10, 110, 50, 120 })
    };

    const auto blocks = assembler_t ().assemble (page, 2);

    BOOST_TEST_REQUIRE (blocks.size () == 3U);

    BOOST_TEST (blocks [0].type == block_type_t::caption);
    BOOST_TEST (blocks [0].text == "Table 1: results");

    BOOST_TEST (blocks [1].type == block_type_t::table);
    BOOST_TEST (blocks [1].box == (bbox_t{ 0, 100, 200, 300 }));

    BOOST_TEST (blocks [2].type == block_type_t::table);
    BOOST_TEST (blocks [2].box == (bbox_t{ 0, 400, 200, 500 }));

    for (const auto& block : blocks) {
        BOOST_TEST (block.pages.first == 2U);
        BOOST_TEST (block.pages.last == 2U);
    }
}

BOOST_AUTO_TEST_CASE(reading_order_) {
    page_t page;

    page.regions = {
        make_region (label_t::page_footer, bbox_t{ 0, 900, 600, 950 }),
        make_region (label_t::text,        bbox_t{ 0, 100, 600, 500 }),
        make_region (label_t::picture,     bbox_t{ 0, 520, 600, 880 }),
        make_region (label_t::page_header, bbox_t{ 0,  10, 600,  50 })
    };

    page.lines = {
        make_line ("footer", bbox_t{ 10, 910, 300, 930 }),
        make_line ("body 1", bbox_t{ 10, 110, 500, 130 }),
        make_line ("header", bbox_t{ 10,  20, 300,  40 }),
        make_line ("body 2", bbox_t{ 10, 140, 500, 160 })
    };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 4U);

    BOOST_TEST (blocks [0].type == block_type_t::header);
    BOOST_TEST (blocks [1].type == block_type_t::text);
    BOOST_TEST (blocks [1].text == "body 1\nbody 2");
    BOOST_TEST (blocks [2].type == block_type_t::image);
    BOOST_TEST (blocks [3].type == block_type_t::footer);

    for (size_t i = 1; i < blocks.size (); ++i) {
        BOOST_TEST (
            blocks [i - 1].box.top_left ().y <= blocks [i].box.top_left ().y);
    }
}

BOOST_AUTO_TEST_CASE(stable_order_) {
    page_t page;

    //
    // Same top edge, side by side:
    //
    page.lines = {
        make_line ("right", bbox_t{ 300, 10, 400, 20 }),
        make_line ("left",  bbox_t{   0, 10, 100, 20 }),
        make_line ("mid",   bbox_t{ 150, 10, 250, 20 })
    };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 3U);
    BOOST_TEST (blocks [0].text == "right");
    BOOST_TEST (blocks [1].text == "left");
    BOOST_TEST (blocks [2].text == "mid");
}

BOOST_AUTO_TEST_CASE(injected_after_text_on_ties_) {
    page_t page;

    page.regions = {
        make_region (label_t::picture, bbox_t{ 200, 10, 400, 100 })
    };

    page.lines = { make_line ("aside", bbox_t{ 0, 10, 100, 20 }) };

    const auto blocks = assembler_t ().assemble (page, 0);

    BOOST_TEST_REQUIRE (blocks.size () == 2U);
    BOOST_TEST (blocks [0].type == block_type_t::undefined);
    BOOST_TEST (blocks [1].type == block_type_t::image);
}

BOOST_AUTO_TEST_CASE(empty_line_) {
    page_t page;

    page.lines = {
        make_line ("fine", bbox_t{ 0, 0, 10, 10 }),
        text_line_t{ }
    };

    try {
        assembler_t ().assemble (page, 4);
        BOOST_FAIL ("expected an empty_line error");
    }
    catch (const empty_line& e) {
        BOOST_TEST (std::string (e.what ()).find ("page 4, line 1") == 0U);
    }
}

BOOST_AUTO_TEST_CASE(invalid_word_geometry_) {
    page_t page;

    page.lines = {
        make_line ("inverted", bbox_t{ 10, 0, 0, 10 })
    };

    BOOST_CHECK_THROW (assembler_t ().assemble (page, 0), invalid_geometry);

    page.lines = {
        make_line ("nan", bbox_t{
                0, 0, std::numeric_limits< double >::quiet_NaN (), 10 })
    };

    BOOST_CHECK_THROW (assembler_t ().assemble (page, 0), invalid_geometry);
}

BOOST_AUTO_TEST_CASE(unbounded_line_) {
    page_t page;

    //
    // Each word is representable, their union's area is not:
    //
    page.lines = {
        text_line_t{ {
            word_t{ "near", bbox_t{ 0, 0, 1, 1 } },
            word_t{ "far",  bbox_t{ 1e200, 1e200, 1e200, 1e200 } } } }
    };

    try {
        assembler_t ().assemble (page, 2);
        BOOST_FAIL ("expected an invalid_geometry error");
    }
    catch (const invalid_geometry& e) {
        BOOST_TEST (std::string (e.what ()).find ("page 2, line 0") == 0U);
    }
}

BOOST_AUTO_TEST_CASE(duplicate_region_id_) {
    page_t page;

    const auto title = make_region (label_t::title, bbox_t{ 0, 0, 100, 20 });

    page.regions = {
        title,
        layout_region_t{
            title.id, label_t::page_footer, bbox_t{ 0, 900, 100, 920 } }
    };

    page.lines = {
        make_line ("Heading", bbox_t{ 5, 2, 95, 10 }),
        make_line ("page 3",  bbox_t{ 5, 902, 95, 918 })
    };

    try {
        assembler_t ().assemble (page, 0);
        BOOST_FAIL ("expected a conflicting_population error");
    }
    catch (const conflicting_population& e) {
        BOOST_TEST (std::string (e.what ()).find ("page 0, region 1") == 0U);
    }
}

BOOST_AUTO_TEST_CASE(invalid_region_geometry_) {
    page_t page;

    page.regions = {
        make_region (label_t::text,    bbox_t{ 0, 0, 100, 100 }),
        make_region (label_t::picture, bbox_t{ 0, 200, 100, 150 })
    };

    try {
        assembler_t ().assemble (page, 0);
        BOOST_FAIL ("expected an invalid_geometry error");
    }
    catch (const invalid_geometry& e) {
        BOOST_TEST (std::string (e.what ()).find ("page 0, region 1") == 0U);
    }
}

////////////////////////////////////////////////////////////////////////

static pages_t
make_pages (size_t n) {
    pages_t pages;

    for (size_t i = 0; i < n; ++i) {
        page_t page;

        page.dimensions = page_dimensions_t{ 1000, 800 };

        page.regions = {
            make_region (label_t::title,   bbox_t{ 0,   0, 800,  40 }),
            make_region (label_t::text,    bbox_t{ 0,  50, 800, 400 }),
            make_region (label_t::picture, bbox_t{ 0, 450, 800, 900 })
        };

        page.lines = {
            make_line (fmt::format ("body {} a", i), bbox_t{ 10,  60, 700,  80 }),
            make_line (fmt::format ("title {}", i),  bbox_t{ 10,   5, 700,  30 }),
            make_line (fmt::format ("body {} b", i), bbox_t{ 10,  90, 700, 110 }),
            make_line (fmt::format ("note {}", i),   bbox_t{ 10, 950, 700, 970 })
        };

        pages.push_back (std::move (page));
    }

    return pages;
}

BOOST_DATA_TEST_CASE(
    document_, data::make ({ 1, 2, 3, 8, 32 }), workers) {

    const auto pages = make_pages (12);

    const auto doc = assembler_t (make_params (workers)).assemble (
        pages, metadata_t{ { "source", "test" } });

    BOOST_TEST (doc.detection_origin == "doctr");
    BOOST_TEST (doc.metadata.at ("source") == "test");
    BOOST_TEST (doc.dimensions.size () == pages.size ());

    BOOST_TEST_REQUIRE (doc.content.size () == 4 * pages.size ());

    for (size_t i = 0; i < pages.size (); ++i) {
        const auto* p = &doc.content [4 * i];

        BOOST_TEST (p [0].type == block_type_t::title);
        BOOST_TEST (p [0].text == fmt::format ("title {}", i));

        BOOST_TEST (p [1].type == block_type_t::text);
        BOOST_TEST (p [1].text == fmt::format ("body {} a\nbody {} b", i, i));

        BOOST_TEST (p [2].type == block_type_t::image);

        BOOST_TEST (p [3].type == block_type_t::undefined);
        BOOST_TEST (p [3].text == fmt::format ("note {}", i));

        for (size_t j = 0; j < 4; ++j) {
            BOOST_TEST (p [j].pages.first == i);
            BOOST_TEST (p [j].pages.last == i);
        }
    }
}

BOOST_DATA_TEST_CASE(
    document_error_, data::make ({ 1, 4 }), workers) {

    auto pages = make_pages (6);

    pages [2].lines.push_back (text_line_t{ });
    pages [4].lines.push_back (text_line_t{ });

    try {
        assembler_t (make_params (workers)).assemble (pages);
        BOOST_FAIL ("expected an empty_line error");
    }
    catch (const empty_line& e) {
        BOOST_TEST (std::string (e.what ()).find ("page 2,") == 0U);
    }
}

BOOST_AUTO_TEST_CASE(empty_document_) {
    const auto doc = assembler_t (make_params (4)).assemble (pages_t{ });

    BOOST_TEST (doc.content.empty ());
    BOOST_TEST (doc.metadata.empty ());
    BOOST_TEST (doc.detection_origin == "doctr");
}

BOOST_AUTO_TEST_CASE(detection_origin_) {
    params_t params;
    params.detection_origin = "tesseract";

    const auto doc = assembler_t (params).assemble (make_pages (1));
    BOOST_TEST (doc.detection_origin == "tesseract");
}

BOOST_AUTO_TEST_CASE(threshold_) {
    page_t page;

    page.regions = { make_region (label_t::title, bbox_t{ 0, 0, 100, 20 }) };

    //
    // Half of the line lies in the title region:
    //
    page.lines = { make_line ("half", bbox_t{ 50, 0, 150, 20 }) };

    {
        const auto blocks = assembler_t ().assemble (page, 0);

        BOOST_TEST_REQUIRE (blocks.size () == 1U);
        BOOST_TEST (blocks [0].type == block_type_t::undefined);
    }

    {
        params_t params;
        params.overlap_threshold = .4;

        const auto blocks = assembler_t (params).assemble (page, 0);

        BOOST_TEST_REQUIRE (blocks.size () == 1U);
        BOOST_TEST (blocks [0].type == block_type_t::title);
    }
}

BOOST_AUTO_TEST_SUITE_END()
