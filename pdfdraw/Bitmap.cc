// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <stdexcept>

#include <pdfdraw/Bitmap.hh>

namespace pdfdraw {

colour_t bitmap_t::pixel(int x, int y) const
{
    if (x < 0 || x >= width || y < 0 || y >= height)
        throw std::out_of_range("bitmap_t::pixel");

    const size_t off = (size_t(y) * width + x) * 3;

    return {
        (unsigned char)rgb[off],
        (unsigned char)rgb[off + 1],
        (unsigned char)rgb[off + 2]
    };
}

std::ostream &operator<<(std::ostream &ss, const bitmap_t &bmp)
{
    ss << "bitmap(" << bmp.width << "x" << bmp.height;

    if (bmp.key)
        ss << " key=" << *bmp.key;

    if (bmp.mask)
        ss << " mask=" << bmp.mask->width << "x" << bmp.mask->height;

    return ss << ")";
}

} // namespace pdfdraw
