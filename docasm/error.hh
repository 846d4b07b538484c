// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef DOCASM_DOCASM_ERROR_HH
#define DOCASM_DOCASM_ERROR_HH

#include <defs.hh>

#include <functional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace docasm {

enum error_category_t {
    errSyntaxError,   // input is malformed
    errConfig,        // problem with the config file
    errCommandLine,   // bad command line argument
    errIO,            // file or stream I/O failure
    errGeometry,      // malformed line or region geometry
    errLayout,        // conflicting layout/text detections
    errInternal       // unexpected runtime failure
};

const char* name_of (error_category_t);

//
// Diagnostics sink, silenced by the `errQuiet' config command; debug output is
// only printed in verbose mode:
//
void set_error_quiet (bool);
void set_verbose (bool);

bool verbose ();

//
// Divert diagnostics from stderr to a callback, or back to stderr for an empty
// one; quiet mode still silences them:
//
using error_callback_t = std::function<
    void (error_category_t, long, const std::string&) >;

void set_error_callback (error_callback_t);

void vreport (error_category_t, long, fmt::string_view, fmt::format_args);
void vtrace (fmt::string_view, fmt::format_args);

//
// Report a diagnostic; `pos' is the index of the offending item (line, region,
// config file line) or -1 when not applicable:
//
template< typename ... Args >
inline void
error (error_category_t category, long pos, fmt::format_string< Args... > s,
       Args&& ... args) {
    vreport (category, pos, s, fmt::make_format_args (args...));
}

template< typename ... Args >
inline void
debug (fmt::format_string< Args... > s, Args&& ... args) {
    if (verbose ()) {
        vtrace (s, fmt::make_format_args (args...));
    }
}

////////////////////////////////////////////////////////////////////////

//
// Contract violations raised while assembling a document:
//
struct assembly_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A box with inverted or non-finite coordinates:
struct invalid_geometry : assembly_error {
    using assembly_error::assembly_error;
};

// A text line without any word geometry:
struct empty_line : assembly_error {
    using assembly_error::assembly_error;
};

// One block identifier populated both by text merging and by injection:
struct conflicting_population : assembly_error {
    using assembly_error::assembly_error;
};

// A layout label outside the detector's vocabulary:
struct invalid_label : assembly_error {
    using assembly_error::assembly_error;
};

//
// Malformed serialized input:
//
struct format_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace docasm

#endif // DOCASM_DOCASM_ERROR_HH
