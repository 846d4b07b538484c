// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef DOCASM_CONFIG_HH
#define DOCASM_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "docasm"
#define PACKAGE_NAME "docasm"
#define PACKAGE_STRING "docasm 0.3.0"
#define PACKAGE_TARNAME "docasm"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.3.0"
#define VERSION "0.3.0"

//------------------------------------------------------------------------
// assembly defaults
//------------------------------------------------------------------------

// fraction of a line's area that must be covered by a layout region
#define DOCASM_OVERLAP_THRESHOLD 0.6

// tag of the text detection/recognition pipeline feeding the assembler
#define DOCASM_DETECTION_ORIGIN "doctr"

//------------------------------------------------------------------------
// config file name
//------------------------------------------------------------------------

#define DOCASM_USER_CONFIG_FILE ".docasmrc"
#define DOCASM_SYS_CONFIG_FILE "/etc/docasmrc"

#endif // DOCASM_CONFIG_HH
