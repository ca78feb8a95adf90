// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFDRAW_PDFDRAW_BITPACK_HH
#define PDFDRAW_PDFDRAW_BITPACK_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace pdfdraw {

//
// Unpacks n samples of 1, 2, 4 or 8 bits, the first sample in the most
// significant bits of a byte:
//
std::vector< unsigned >
unpack (const char*, const char* const, size_t, size_t);

//
// Linear black to white ramp of 2^bits RGB entries:
//
std::string gray_palette (size_t bits);

//
// Black (0) and white (1):
//
std::string bw_palette ();

//
// Expands each gray entry of a palette to an RGB one:
//
std::string gray_to_rgb_palette (const std::string&);

//
// Replaces each sample of a width x height raster by its chunk in the
// palette; rows start on a byte boundary. An index past the end of the
// palette yields a zero chunk.
//
std::string
deindex (const std::string& data, size_t width, size_t height, size_t bits,
         const std::string& palette, size_t chunk = 3);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_BITPACK_HH
