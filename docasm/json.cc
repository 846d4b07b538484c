// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <stdexcept>

#include <docasm/error.hh>
#include <docasm/identifier.hh>
#include <docasm/json.hh>
#include <docasm/label.hh>

#include <boost/uuid/string_generator.hpp>

using json = nlohmann::json;

namespace docasm {
namespace {

const json& member (const json& obj, const char* key) {
    if (!obj.is_object () || !obj.contains (key)) {
        throw format_error (fmt::format ("missing \"{}\"", key));
    }

    return obj [key];
}

const json& array_member (const json& obj, const char* key) {
    const auto& xs = member (obj, key);

    if (!xs.is_array ()) {
        throw format_error (fmt::format ("\"{}\" is not an array", key));
    }

    return xs;
}

//
// [[x0, y0], [x1, y1]]:
//
bbox_t parse_box (const json& obj) {
    if (!obj.is_array () || obj.size () != 2 ||
        !obj [0].is_array () || obj [0].size () != 2 ||
        !obj [1].is_array () || obj [1].size () != 2) {
        throw format_error (fmt::format ("bad box: {}", obj.dump ()));
    }

    return bbox_t{
        obj [0][0].get< double > (), obj [0][1].get< double > (),
        obj [1][0].get< double > (), obj [1][1].get< double > ()
    };
}

label_t parse_label (const json& obj) {
    try {
        if (obj.is_number_integer ()) {
            return label_of (obj.get< int > ());
        }
        else if (obj.is_string ()) {
            return label_of (obj.get< std::string > ());
        }
    }
    catch (const invalid_label& e) {
        throw format_error (e.what ());
    }

    throw format_error (fmt::format ("bad label: {}", obj.dump ()));
}

block_id_t parse_id (const json& obj) {
    try {
        return boost::uuids::string_generator () (obj.get< std::string > ());
    }
    catch (const std::runtime_error&) {
        throw format_error (fmt::format ("bad region id: {}", obj.dump ()));
    }
}

metadata_t parse_metadata (const json& obj) {
    if (!obj.is_object ()) {
        throw format_error ("metadata is not an object");
    }

    metadata_t metadata;

    for (auto& [ key, value ] : obj.items ()) {
        if (!value.is_string ()) {
            throw format_error (fmt::format (
                "metadata \"{}\" is not a string: {}", key, value.dump ()));
        }

        metadata [key] = value.get< std::string > ();
    }

    return metadata;
}

page_t parse_page (const json& obj, id_generator_t& gen) {
    page_t page;

    if (obj.contains ("dimensions")) {
        const auto& dims = obj ["dimensions"];

        if (!dims.is_array () || dims.size () != 2) {
            throw format_error (
                fmt::format ("bad dimensions: {}", dims.dump ()));
        }

        page.dimensions = page_dimensions_t{
            dims [0].get< int > (), dims [1].get< int > ()
        };
    }

    for (const auto& region : array_member (obj, "regions")) {
        page.regions.push_back (layout_region_t{
            region.contains ("id") ? parse_id (region ["id"]) : gen (),
            parse_label (member (region, "label")),
            parse_box (member (region, "bbox"))
        });
    }

    for (const auto& line : array_member (obj, "lines")) {
        text_line_t text_line;

        for (const auto& word : array_member (line, "words")) {
            text_line.words.push_back (word_t{
                member (word, "value").get< std::string > (),
                parse_box (member (word, "geometry"))
            });
        }

        page.lines.push_back (std::move (text_line));
    }

    return page;
}

json to_json (const point_t& point) {
    return { { "x", point.x }, { "y", point.y } };
}

json to_json (const metadata_t& metadata) {
    auto obj = json::object ();

    for (const auto& [ key, value ] : metadata) {
        obj [key] = value;
    }

    return obj;
}

} // anonymous

input_t parse_input (const json& obj) {
    input_t input;
    id_generator_t gen;

    try {
        size_t index = 0;

        for (const auto& page : array_member (obj, "pages")) {
            try {
                input.pages.push_back (parse_page (page, gen));
            }
            catch (const format_error& e) {
                throw format_error (
                    fmt::format ("page {}: {}", index, e.what ()));
            }
            catch (const json::exception& e) {
                throw format_error (
                    fmt::format ("page {}: {}", index, e.what ()));
            }

            ++index;
        }

        if (obj.contains ("metadata")) {
            input.metadata = parse_metadata (obj ["metadata"]);
        }

        if (obj.contains ("detection_origin")) {
            input.detection_origin =
                obj ["detection_origin"].get< std::string > ();
        }
    }
    catch (const json::exception& e) {
        throw format_error (e.what ());
    }

    return input;
}

input_t parse_input (std::istream& in) {
    json obj;

    try {
        in >> obj;
    }
    catch (const json::exception& e) {
        throw format_error (e.what ());
    }

    return parse_input (obj);
}

json to_json (const bbox_t& box) {
    return {
        { "top_left", to_json (box.top_left ()) },
        { "bottom_right", to_json (box.bottom_right ()) }
    };
}

json to_json (const block_t& block) {
    return {
        { "block_type", name_of (block.type) },
        { "bbox", to_json (block.box) },
        { "text", block.text },
        { "metadata", to_json (block.metadata) },
        { "page_range", { block.pages.first, block.pages.last } }
    };
}

json to_json (const document_t& doc) {
    auto metadata = to_json (doc.metadata);

    if (!doc.dimensions.empty ()) {
        auto dims = json::array ();

        for (const auto& x : doc.dimensions) {
            if (x) {
                dims.push_back ({ x->height, x->width });
            }
            else {
                dims.push_back (nullptr);
            }
        }

        metadata ["page_dimensions"] = std::move (dims);
    }

    auto content = json::array ();

    for (const auto& block : doc.content) {
        content.push_back (to_json (block));
    }

    return {
        { "metadata", std::move (metadata) },
        { "content", std::move (content) },
        { "detection_origin", doc.detection_origin }
    };
}

std::string serialize (const document_t& doc) {
    //
    // Metadata and the origin tag come from the command line and the config
    // file, unchecked; replace invalid UTF-8 instead of failing the dump:
    //
    return to_json (doc).dump (
        2, ' ', false, json::error_handler_t::replace);
}

} // namespace docasm
