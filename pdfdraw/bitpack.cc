// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <stdexcept>

#include <range/v3/algorithm/copy.hpp>
#include <range/v3/algorithm/for_each.hpp>
using namespace ranges;

#include <pdfdraw/Error.hh>
#include <pdfdraw/bitpack.hh>

namespace pdfdraw {

#define U(x) unsigned((unsigned char)(x))

std::vector< unsigned >
unpack (const char* psrc, const char* const pend, size_t n, size_t bps) {
    switch (bps) {
    case 1: case 2: case 4: case 8:
        break;

    default:
        throw std::invalid_argument ("invalid sample size");
    }

    ASSERT (psrc && pend && psrc <= pend);

    const size_t distance = std::distance (psrc, pend);

    if (((n * bps + 7) >> 3) > distance)
        throw decode_error ("short sample data");

    std::vector< unsigned > xs (n);

    const unsigned mask = (1U << bps) - 1;
    const size_t per_byte = 8 / bps;

    for (size_t i = 0; i < n; ++i) {
        const size_t shift = 8 - bps * (i % per_byte + 1);
        xs [i] = (U (psrc [i / per_byte]) >> shift) & mask;
    }

    return xs;
}

std::string gray_palette (size_t bits) {
    if (bits < 1 || bits > 8)
        throw std::invalid_argument ("invalid sample size");

    const size_t n = size_t (1) << bits;

    std::string xs;
    xs.reserve (3 * n);

    for (size_t i = 0; i < n; ++i)
        xs.append (3, char (i * 255 / (n - 1)));

    return xs;
}

std::string bw_palette () {
    return std::string ("\x00\x00\x00\xFF\xFF\xFF", 6);
}

std::string gray_to_rgb_palette (const std::string& gray) {
    std::string xs;
    xs.reserve (3 * gray.size ());

    for_each (gray, [&](auto c) { xs.append (3, c); });

    return xs;
}

std::string
deindex (const std::string& data, size_t width, size_t height, size_t bits,
         const std::string& palette, size_t chunk) {
    if (0 == chunk)
        throw std::invalid_argument ("palette chunk of 0");

    const size_t row = (width * bits + 7) >> 3;

    if (data.size () < row * height)
        throw decode_error (fmt::format (
            "short image data: {0:d} bytes, expected {1:d}",
            data.size (), row * height));

    std::string xs (width * height * chunk, '\0');
    auto pdst = xs.begin ();

    for (size_t y = 0; y < height; ++y) {
        const char* psrc = data.data () + y * row;

        for (auto index : unpack (psrc, psrc + row, width, bits)) {
            const size_t off = index * chunk;

            if (off + chunk <= palette.size ())
                copy (palette.begin () + off, palette.begin () + off + chunk, pdst);

            pdst += chunk;
        }
    }

    return xs;
}

#undef U

} // namespace pdfdraw
