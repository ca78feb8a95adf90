// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_BITMAP_HH
#define PDFDRAW_PDFDRAW_BITMAP_HH

#include <defs.hh>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <pdfdraw/GfxState.hh>

namespace pdfdraw {

//
// A 1-bit transparency mask, one byte per pixel: 0 is transparent, anything
// else is opaque.
//
struct mask_t
{
    int width = 0, height = 0;
    std::string alpha;
};

//------------------------------------------------------------------------
// bitmap_t
//------------------------------------------------------------------------

struct bitmap_t
{
    bitmap_t() = default;

    bitmap_t(int width, int height, std::string rgb)
        : width(width), height(height), rgb(std::move(rgb))
    { }

    int width = 0, height = 0;

    // packed 8-bit RGB, top-down rows, width * height * 3 bytes
    std::string rgb;

    // pixels of this colour are transparent
    std::optional< colour_t > key;

    std::optional< mask_t > mask;

    colour_t pixel(int x, int y) const;
};

using bitmap_ptr = std::shared_ptr< bitmap_t >;

std::ostream &operator<<(std::ostream &, const bitmap_t &);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_BITMAP_HH
