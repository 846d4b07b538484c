// -*- mode: c++; -*-
// Copyright 1998-2013 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <docasm/assembler.hh>
#include <docasm/error.hh>
#include <docasm/json.hh>
#include <docasm/params.hh>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <fmt/format.h>

using namespace docasm;

static int
usage (const po::options_description& desc, bool version_only) {
    fmt::print (stderr, "docasm version {}\n", PACKAGE_VERSION);

    if (!version_only) {
        std::cerr
            << "Usage: docasm [options] <detections.json>\n"
            << desc;
    }

    return 99;
}

int main (int argc, char* argv[]) {
    std::string cfg_filename, output, origin, input_filename;
    std::vector< std::string > meta;

    po::options_description desc ("Options");
    desc.add_options ()
        ("config,c", po::value (&cfg_filename),
         "configuration file to use in place of .docasmrc")
        ("output,o", po::value (&output),
         "output file (default: standard output)")
        ("threshold,t", po::value< double > (),
         "minimum fraction of a line's area covered by its region")
        ("workers,j", po::value< long > (),
         "number of pages assembled concurrently")
        ("origin", po::value (&origin),
         "detection origin tag of the output document")
        ("meta,m", po::value (&meta),
         "document metadata entry, as key=value")
        ("quiet,q", "don't print any messages or errors")
        ("verbose,v", "print per-page statistics")
        ("version", "print copyright and version info")
        ("help,h", "print usage information");

    po::options_description hidden;
    hidden.add_options () ("input", po::value (&input_filename));

    po::options_description all;
    all.add (desc).add (hidden);

    po::positional_options_description positional;
    positional.add ("input", 1);

    po::variables_map vm;

    try {
        po::store (
            po::command_line_parser (argc, argv)
                .options (all).positional (positional).run (), vm);
        po::notify (vm);
    }
    catch (const po::error& e) {
        error (errCommandLine, -1, "{}", e.what ());
        return usage (desc, false);
    }

    if (vm.count ("help") || vm.count ("version") || input_filename.empty ()) {
        return usage (desc, vm.count ("version") && !vm.count ("help"));
    }

    // read config file
    params_t params;
    params.load (cfg_filename);

    if (vm.count ("threshold")) {
        const auto x = vm ["threshold"].as< double > ();

        if (x <= 0 || x >= 1) {
            error (errCommandLine, -1, "threshold {} is not in (0, 1)", x);
            return usage (desc, false);
        }

        params.overlap_threshold = x;
    }

    if (vm.count ("workers")) {
        const auto n = vm ["workers"].as< long > ();

        if (n < 1) {
            error (errCommandLine, -1, "workers {} is not a positive count", n);
            return usage (desc, false);
        }

        params.workers = size_t (n);
    }

    if (vm.count ("quiet"))   { params.quiet = true; }
    if (vm.count ("verbose")) { params.verbose = true; }

    params.apply ();

    metadata_t metadata;

    for (const auto& s : meta) {
        const auto pos = s.find ('=');

        if (pos == std::string::npos || 0 == pos) {
            error (errCommandLine, -1, "bad metadata entry '{}'", s);
            return usage (desc, false);
        }

        metadata [s.substr (0, pos)] = s.substr (pos + 1);
    }

    try {
        std::ifstream in (input_filename);

        if (!in) {
            error (errIO, -1, "Couldn't open file '{}'", input_filename);
            return 1;
        }

        auto input = parse_input (in);

        for (auto& [ key, value ] : input.metadata) {
            metadata.emplace (key, value);
        }

        if (origin.empty () && input.detection_origin) {
            origin = *input.detection_origin;
        }

        if (!origin.empty ()) {
            params.detection_origin = origin;
        }

        auto doc = assembler_t (params).assemble (input.pages, metadata);
        const auto text = serialize (doc);

        if (output.empty ()) {
            std::cout << text << std::endl;
        }
        else {
            std::ofstream out (output);

            if (!(out << text << std::endl)) {
                error (errIO, -1, "Couldn't write file '{}'", output);
                return 1;
            }
        }
    }
    catch (const format_error& e) {
        error (errSyntaxError, -1, "{}: {}", input_filename, e.what ());
        return 1;
    }
    catch (const invalid_geometry& e) {
        error (errGeometry, -1, "{}", e.what ());
        return 1;
    }
    catch (const empty_line& e) {
        error (errGeometry, -1, "{}", e.what ());
        return 1;
    }
    catch (const assembly_error& e) {
        error (errLayout, -1, "{}", e.what ());
        return 1;
    }
    catch (const std::exception& e) {
        error (errInternal, -1, "{}", e.what ());
        return 1;
    }

    return 0;
}
