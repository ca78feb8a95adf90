// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
#define PDFDRAW_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH

#include <cctype>
#include <ios>

#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace pdfdraw {
namespace iostreams {

//
// ASCIIHexDecode: pairs of hex digits, whitespace ignored, terminated by '>'
// or by the end of the source. An odd final digit is completed with a 0.
//
struct asciihex_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (eof_)
            return EOF;

        int hi = next(src);

        if (hi < 0)
            return eof_ = true, EOF;

        int lo = next(src);

        if (lo < 0)
            eof_ = true, lo = 0;

        return (hi << 4) | lo;
    }

    template< typename Source >
    void close(Source &)
    {
        eof_ = false;
    }

private:
    template< typename Source >
    int next(Source &src)
    {
        for (int c; EOF != (c = boost::iostreams::get(src));) {
            if (c == boost::iostreams::WOULD_BLOCK)
                continue;

            if (c == '>')
                return -1;

            if (isspace(c))
                continue;

            if (c >= '0' && c <= '9')
                return c - '0';

            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;

            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;

            throw std::ios_base::failure("asciihex: invalid character");
        }

        return -1;
    }

private:
    bool eof_ = false;
};

} // namespace iostreams
} // namespace pdfdraw

#endif // PDFDRAW_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
