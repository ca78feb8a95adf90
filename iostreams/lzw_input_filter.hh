// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_IOSTREAMS_LZW_INPUT_FILTER_HH
#define PDFDRAW_IOSTREAMS_LZW_INPUT_FILTER_HH

#include <array>
#include <ios>

#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace pdfdraw {
namespace iostreams {

//
// LZWDecode: variable width codes of 9 to 12 bits, MSB first, 256 clears the
// table, 257 ends the data. With early change (the default) the code width
// grows one code earlier than the table requires.
//
struct lzw_input_filter_t : public boost::iostreams::input_filter
{
    explicit lzw_input_filter_t(bool early_change = true)
        : early_(early_change ? 1 : 0)
    {
        clear();
    }

    template< typename Source >
    int get(Source &src)
    {
        if (seq_pos_ >= seq_len_ && !next(src))
            return EOF;

        return seq_[seq_pos_++];
    }

    template< typename Source >
    void close(Source &)
    {
        input_ = input_bits_ = 0;
        eof_ = false;
        clear();
    }

private:
    struct entry_t
    {
        int length;
        int head;
        unsigned char tail;
    };

    using table_type = std::array< entry_t, 4097 >;

    void clear()
    {
        next_code_ = 258;
        next_bits_ = 9;
        seq_pos_ = seq_len_ = 0;
        first_ = true;
    }

    template< typename Source >
    int code(Source &src)
    {
        while (input_bits_ < next_bits_) {
            int c = boost::iostreams::get(src);

            if (c == boost::iostreams::WOULD_BLOCK)
                continue;

            if (c == EOF)
                return EOF;

            input_ = (input_ << 8) | (c & 0xFF);
            input_bits_ += 8;
        }

        int x = (input_ >> (input_bits_ - next_bits_)) & ((1 << next_bits_) - 1);
        input_bits_ -= next_bits_;

        return x;
    }

    template< typename Source >
    bool next(Source &src)
    {
        if (eof_)
            return false;

        int x;

        for (;;) {
            x = code(src);

            if (x == EOF || x == 257)
                return eof_ = true, false;

            if (x != 256)
                break;

            clear();
        }

        if (next_code_ >= 4097)
            clear();

        auto &table = table_;
        const int next_length = seq_len_ + 1;

        if (x < 256) {
            seq_[0] = (unsigned char)x;
            seq_len_ = 1;
        } else if (x < next_code_) {
            seq_len_ = table[x].length;

            int i = seq_len_ - 1, j = x;

            for (; i > 0; --i) {
                seq_[i] = table[j].tail;
                j = table[j].head;
            }

            seq_[0] = (unsigned char)j;
        } else if (x == next_code_ && !first_) {
            seq_[seq_len_++] = new_char_;
        } else {
            throw std::ios_base::failure("lzw: unexpected code");
        }

        new_char_ = seq_[0];

        if (first_) {
            first_ = false;
        } else {
            table[next_code_].length = next_length;
            table[next_code_].head = prev_code_;
            table[next_code_].tail = new_char_;

            ++next_code_;

            if (next_code_ + early_ == 512)
                next_bits_ = 10;
            else if (next_code_ + early_ == 1024)
                next_bits_ = 11;
            else if (next_code_ + early_ == 2048)
                next_bits_ = 12;
        }

        prev_code_ = x;
        seq_pos_ = 0;

        return true;
    }

private:
    int early_;

    table_type table_{ };

    int next_code_ = 258, next_bits_ = 9, prev_code_ = 0;
    unsigned input_ = 0;
    int input_bits_ = 0;

    std::array< unsigned char, 4097 > seq_{ };
    int seq_len_ = 0, seq_pos_ = 0;
    unsigned char new_char_ = 0;

    bool first_ = true, eof_ = false;
};

} // namespace iostreams
} // namespace pdfdraw

#endif // PDFDRAW_IOSTREAMS_LZW_INPUT_FILTER_HH
