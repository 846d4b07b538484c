// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef DOCASM_UTILS_STRING_HH
#define DOCASM_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <string_view>
#include <vector>

namespace docasm {

//
// Split on any of the delimiters, dropping empty tokens:
//
std::vector< std::string >
split (std::string_view s, std::string_view delims = " \t\r\n");

} // namespace docasm

#endif // DOCASM_UTILS_STRING_HH
