// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_IOSTREAMS_ASCII85_INPUT_FILTER_HH
#define PDFDRAW_IOSTREAMS_ASCII85_INPUT_FILTER_HH

#include <array>
#include <cctype>
#include <cstdint>
#include <ios>

#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace pdfdraw {
namespace iostreams {

//
// ASCII85Decode: groups of five base-85 digits ('!' to 'u') encode four
// bytes, 'z' stands for four zero bytes, '~>' ends the data. A final partial
// group of n digits yields n - 1 bytes.
//
struct ascii85_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (pos_ == len_ && (eof_ || !fill(src)))
            return EOF;

        return buf_[pos_++];
    }

    template< typename Source >
    void close(Source &)
    {
        pos_ = len_ = 0;
        eof_ = false;
    }

private:
    template< typename Source >
    bool fill(Source &src)
    {
        std::array< unsigned, 5 > xs{ };
        size_t n = 0;

        while (n < xs.size()) {
            int c = boost::iostreams::get(src);

            if (c == boost::iostreams::WOULD_BLOCK)
                continue;

            if (c == EOF || c == '~') {
                eof_ = true;
                break;
            }

            if (isspace(c))
                continue;

            if (c == 'z' && n == 0) {
                buf_ = { 0, 0, 0, 0 };
                pos_ = 0;
                len_ = 4;
                return true;
            }

            if (c < '!' || c > 'u')
                throw std::ios_base::failure("ascii85: invalid character");

            xs[n++] = unsigned(c - '!');
        }

        if (0 == n)
            return false;

        if (1 == n)
            throw std::ios_base::failure("ascii85: truncated group");

        for (size_t i = n; i < xs.size(); ++i)
            xs[i] = 'u' - '!';

        uint64_t t = 0;

        for (auto x : xs)
            t = t * 85 + x;

        if (t > 0xFFFFFFFFULL)
            throw std::ios_base::failure("ascii85: group out of range");

        buf_[0] = (t >> 24) & 0xFF;
        buf_[1] = (t >> 16) & 0xFF;
        buf_[2] = (t >>  8) & 0xFF;
        buf_[3] =  t        & 0xFF;

        pos_ = 0;
        len_ = n - 1;

        return true;
    }

private:
    std::array< unsigned char, 4 > buf_{ };
    size_t pos_ = 0, len_ = 0;
    bool eof_ = false;
};

} // namespace iostreams
} // namespace pdfdraw

#endif // PDFDRAW_IOSTREAMS_ASCII85_INPUT_FILTER_HH
