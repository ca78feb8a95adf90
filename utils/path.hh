// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef PDFDRAW_UTILS_PATH_HH
#define PDFDRAW_UTILS_PATH_HH

#include <defs.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace pdfdraw {

// Get home directory path.
fs::path home_path();

// Expand `~' and environment variables in a path, if the expansion yields a
// single word; returns the path unchanged otherwise.
fs::path expand_path(const fs::path &);

} // namespace pdfdraw

#endif // PDFDRAW_UTILS_PATH_HH
