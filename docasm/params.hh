// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_PARAMS_HH
#define DOCASM_DOCASM_PARAMS_HH

#include <defs.hh>

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace docasm {

//
// Assembly parameters, read from a docasmrc config file:
//
//   # comment
//   overlapThreshold 0.6
//   detectionOrigin  doctr
//   workers          4
//   errQuiet         no
//   verbose          no
//
struct params_t {
    //
    // A line belongs to a region covering strictly more than this fraction of
    // the line's area:
    //
    double overlap_threshold = DOCASM_OVERLAP_THRESHOLD;

    std::string detection_origin = DOCASM_DETECTION_ORIGIN;

    //
    // Number of pages assembled concurrently:
    //
    size_t workers = 1;

    bool quiet = false;
    bool verbose = false;

    //
    // Parse config commands from the stream into this object; bad lines are
    // reported and skipped. `name' is used in diagnostics:
    //
    void parse (std::istream&, const std::string& name);

    //
    // Read the named file, or, if empty, the first of ~/.docasmrc and
    // /etc/docasmrc that exists. Returns false if no file could be read:
    //
    bool load (const std::string& filename = { });

    //
    // Push the diagnostic settings to the error reporting module:
    //
    void apply () const;

private:
    void parse_line (const std::string&, const std::string&, int);

    void parse_yes_no (
        const char*, bool&, const std::vector< std::string >&,
        const std::string&, int);
};

} // namespace docasm

#endif // DOCASM_DOCASM_PARAMS_HH
