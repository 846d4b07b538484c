// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <docasm/error.hh>
#include <docasm/params.hh>

#include <utils/string.hh>

#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace docasm {
namespace {

bool parse_double (const std::string& s, double& val) {
    if (s.empty ()) {
        return false;
    }

    char* end = nullptr;

    errno = 0;
    const auto x = std::strtod (s.c_str (), &end);

    if (errno || *end) {
        return false;
    }

    return val = x, true;
}

bool parse_size (const std::string& s, size_t& val) {
    if (s.empty () || s.find_first_not_of ("0123456789") != std::string::npos) {
        return false;
    }

    char* end = nullptr;

    errno = 0;
    const auto x = std::strtoul (s.c_str (), &end, 10);

    if (errno || *end) {
        return false;
    }

    return val = x, true;
}

} // anonymous

void params_t::parse (std::istream& in, const std::string& name) {
    std::string buf;

    for (int line = 1; std::getline (in, buf); ++line) {
        parse_line (buf, name, line);
    }
}

bool params_t::load (const std::string& filename) {
    std::vector< fs::path > candidates;

    if (!filename.empty ()) {
        candidates.emplace_back (filename);
    }
    else {
        if (const char* home = std::getenv ("HOME")) {
            candidates.emplace_back (fs::path (home) / DOCASM_USER_CONFIG_FILE);
        }

        candidates.emplace_back (DOCASM_SYS_CONFIG_FILE);
    }

    for (const auto& path : candidates) {
        std::ifstream in (path.string ());

        if (in) {
            return parse (in, path.string ()), true;
        }
    }

    if (!filename.empty ()) {
        error (errIO, -1, "Couldn't open config file '{}'", filename);
    }

    return false;
}

void params_t::apply () const {
    set_error_quiet (quiet);
    set_verbose (verbose);
}

void params_t::parse_line (
    const std::string& buf, const std::string& name, int line) {
    auto tokens = split (buf.substr (0, buf.find ('#')));

    if (tokens.empty ()) {
        return;
    }

    const auto& cmd = tokens [0];

    auto bad_command = [&]() {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmd,
            name, line);
    };

    if (cmd == "overlapThreshold") {
        double x = 0;

        if (tokens.size () != 2 || !parse_double (tokens [1], x) ||
            x <= 0 || x >= 1) {
            bad_command ();
        }
        else {
            overlap_threshold = x;
        }
    }
    else if (cmd == "detectionOrigin") {
        if (tokens.size () != 2) {
            bad_command ();
        }
        else {
            detection_origin = tokens [1];
        }
    }
    else if (cmd == "workers") {
        size_t n = 0;

        if (tokens.size () != 2 || !parse_size (tokens [1], n) || 0 == n) {
            bad_command ();
        }
        else {
            workers = n;
        }
    }
    else if (cmd == "errQuiet") {
        parse_yes_no ("errQuiet", quiet, tokens, name, line);
    }
    else if (cmd == "verbose") {
        parse_yes_no ("verbose", verbose, tokens, name, line);
    }
    else {
        error (
            errConfig, -1, "Unknown config file command '{}' ({}:{})", cmd,
            name, line);
    }
}

void params_t::parse_yes_no (
    const char* cmd, bool& val, const std::vector< std::string >& tokens,
    const std::string& name, int line) {
    if (tokens.size () == 2) {
        if (tokens [1] == "yes") {
            val = true;
            return;
        }
        else if (tokens [1] == "no") {
            val = false;
            return;
        }
    }

    error (
        errConfig, -1, "Bad '{}' config file command ({}:{})", cmd, name,
        line);
}

} // namespace docasm
