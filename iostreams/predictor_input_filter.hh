// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_IOSTREAMS_PREDICTOR_INPUT_FILTER_HH
#define PDFDRAW_IOSTREAMS_PREDICTOR_INPUT_FILTER_HH

#include <algorithm>
#include <cstdlib>
#include <ios>
#include <vector>

#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace pdfdraw {
namespace iostreams {

//
// Undoes the TIFF (2) or PNG (10 to 15) predictors applied before LZW or
// Flate encoding. PNG rows carry their own predictor tag in a leading byte.
//
struct predictor_input_filter_t : public boost::iostreams::input_filter
{
    predictor_input_filter_t(int predictor, int columns, int colors, int bits)
        : predictor_(predictor),
          colors_(colors),
          pixel_bytes_((colors * bits + 7) >> 3),
          row_bytes_((columns * colors * bits + 7) >> 3),
          prev_(row_bytes_), row_(row_bytes_)
    {
        if (predictor != 2 && (predictor < 10 || predictor > 15))
            throw std::ios_base::failure("predictor: unsupported predictor");

        if (predictor == 2 && bits != 8)
            throw std::ios_base::failure("predictor: unsupported TIFF depth");

        if (columns <= 0 || colors <= 0 || bits <= 0)
            throw std::ios_base::failure("predictor: bad row geometry");
    }

    template< typename Source >
    int get(Source &src)
    {
        if (pos_ >= len_ && !next(src))
            return EOF;

        return row_[pos_++];
    }

    template< typename Source >
    void close(Source &)
    {
        std::fill(prev_.begin(), prev_.end(), 0);
        pos_ = len_ = 0;
        eof_ = false;
    }

private:
    template< typename Source >
    int getc(Source &src)
    {
        int c;

        do
            c = boost::iostreams::get(src);
        while (c == boost::iostreams::WOULD_BLOCK);

        return c;
    }

    static unsigned char paeth(int a, int b, int c)
    {
        const int p = a + b - c;

        const int pa = std::abs(p - a);
        const int pb = std::abs(p - b);
        const int pc = std::abs(p - c);

        return (unsigned char)(pa <= pb && pa <= pc ? a : pb <= pc ? b : c);
    }

    template< typename Source >
    bool next(Source &src)
    {
        if (eof_)
            return false;

        int tag = 0;

        if (predictor_ >= 10) {
            if (EOF == (tag = getc(src)))
                return eof_ = true, false;

            if (tag > 4)
                throw std::ios_base::failure("predictor: bad PNG row tag");
        }

        const int bpp = pixel_bytes_;

        int i = 0;

        for (; i < row_bytes_; ++i) {
            int c = getc(src);

            if (c == EOF) {
                eof_ = true;
                break;
            }

            const int left    = i >= bpp ? row_[i - bpp] : 0;
            const int up      = prev_[i];
            const int up_left = i >= bpp ? prev_[i - bpp] : 0;

            switch (predictor_ >= 10 ? tag : 0) {
            case 1: // Sub
                row_[i] = (unsigned char)(c + left);
                break;

            case 2: // Up
                row_[i] = (unsigned char)(c + up);
                break;

            case 3: // Average
                row_[i] = (unsigned char)(c + ((left + up) >> 1));
                break;

            case 4: // Paeth
                row_[i] = (unsigned char)(c + paeth(left, up, up_left));
                break;

            default:
                row_[i] = (unsigned char)c;
                break;
            }
        }

        if (0 == i)
            return false;

        if (predictor_ == 2) {
            for (int j = colors_; j < i; ++j)
                row_[j] = (unsigned char)(row_[j] + row_[j - colors_]);
        }

        std::copy(row_.begin(), row_.begin() + i, prev_.begin());

        pos_ = 0;
        len_ = i;

        return true;
    }

private:
    int predictor_, colors_, pixel_bytes_, row_bytes_;

    std::vector< unsigned char > prev_, row_;
    int pos_ = 0, len_ = 0;

    bool eof_ = false;
};

} // namespace iostreams
} // namespace pdfdraw

#endif // PDFDRAW_IOSTREAMS_PREDICTOR_INPUT_FILTER_HH
