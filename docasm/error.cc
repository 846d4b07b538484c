// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <utility>

#include <docasm/error.hh>

#include <fmt/format.h>

namespace docasm {
namespace {

std::atomic< bool > quiet_{ false }, verbose_{ false };

//
// Workers report concurrently; keep each diagnostic on its own line:
//
std::mutex mutex_;

error_callback_t callback_;

} // anonymous

const char* name_of (error_category_t category) {
    static const char* names [] = {
        "Syntax Error",
        "Config Error",
        "Command Line Error",
        "I/O Error",
        "Geometry Error",
        "Layout Error",
        "Internal Error"
    };

    return names [category];
}

void set_error_quiet (bool value) { quiet_ = value; }
void set_verbose (bool value) { verbose_ = value; }

bool verbose () { return verbose_; }

void set_error_callback (error_callback_t callback) {
    std::lock_guard< std::mutex > lock (mutex_);
    callback_ = std::move (callback);
}

void vreport (error_category_t category, long pos, fmt::string_view s,
              fmt::format_args args) {
    if (quiet_) {
        return;
    }

    auto msg = fmt::vformat (s, args);

    std::lock_guard< std::mutex > lock (mutex_);

    if (callback_) {
        callback_ (category, pos, msg);
        return;
    }

    if (pos >= 0) {
        fmt::print (stderr, "{} ({}): {}\n", name_of (category), pos, msg);
    }
    else {
        fmt::print (stderr, "{}: {}\n", name_of (category), msg);
    }

    fflush (stderr);
}

void vtrace (fmt::string_view s, fmt::format_args args) {
    auto msg = fmt::vformat (s, args);

    std::lock_guard< std::mutex > lock (mutex_);
    fmt::print (stderr, "debug: {}\n", msg);
}

} // namespace docasm
