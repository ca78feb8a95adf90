// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <iterator>
#include <vector>

#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

#include <pdfdraw/CCITTFax.hh>
#include <pdfdraw/Error.hh>

namespace pdfdraw {
namespace {

struct code_t
{
    unsigned short code;
    unsigned char  bits;
    unsigned short run;
};

//
// ITU-T T.4 run-length codes: terminating codes (0-63), make-up codes, and
// the extended make-up codes common to both colours:
//
const code_t white_codes[] = {
    { 0x35,  8,    0 }, { 0x07,  6,    1 }, { 0x07,  4,    2 }, { 0x08,  4,    3 },
    { 0x0B,  4,    4 }, { 0x0C,  4,    5 }, { 0x0E,  4,    6 }, { 0x0F,  4,    7 },
    { 0x13,  5,    8 }, { 0x14,  5,    9 }, { 0x07,  5,   10 }, { 0x08,  5,   11 },
    { 0x08,  6,   12 }, { 0x03,  6,   13 }, { 0x34,  6,   14 }, { 0x35,  6,   15 },
    { 0x2A,  6,   16 }, { 0x2B,  6,   17 }, { 0x27,  7,   18 }, { 0x0C,  7,   19 },
    { 0x08,  7,   20 }, { 0x17,  7,   21 }, { 0x03,  7,   22 }, { 0x04,  7,   23 },
    { 0x28,  7,   24 }, { 0x2B,  7,   25 }, { 0x13,  7,   26 }, { 0x24,  7,   27 },
    { 0x18,  7,   28 }, { 0x02,  8,   29 }, { 0x03,  8,   30 }, { 0x1A,  8,   31 },
    { 0x1B,  8,   32 }, { 0x12,  8,   33 }, { 0x13,  8,   34 }, { 0x14,  8,   35 },
    { 0x15,  8,   36 }, { 0x16,  8,   37 }, { 0x17,  8,   38 }, { 0x28,  8,   39 },
    { 0x29,  8,   40 }, { 0x2A,  8,   41 }, { 0x2B,  8,   42 }, { 0x2C,  8,   43 },
    { 0x2D,  8,   44 }, { 0x04,  8,   45 }, { 0x05,  8,   46 }, { 0x0A,  8,   47 },
    { 0x0B,  8,   48 }, { 0x52,  8,   49 }, { 0x53,  8,   50 }, { 0x54,  8,   51 },
    { 0x55,  8,   52 }, { 0x24,  8,   53 }, { 0x25,  8,   54 }, { 0x58,  8,   55 },
    { 0x59,  8,   56 }, { 0x5A,  8,   57 }, { 0x5B,  8,   58 }, { 0x4A,  8,   59 },
    { 0x4B,  8,   60 }, { 0x32,  8,   61 }, { 0x33,  8,   62 }, { 0x34,  8,   63 },

    { 0x1B,  5,   64 }, { 0x12,  5,  128 }, { 0x17,  6,  192 }, { 0x37,  7,  256 },
    { 0x36,  8,  320 }, { 0x37,  8,  384 }, { 0x64,  8,  448 }, { 0x65,  8,  512 },
    { 0x68,  8,  576 }, { 0x67,  8,  640 }, { 0xCC,  9,  704 }, { 0xCD,  9,  768 },
    { 0xD2,  9,  832 }, { 0xD3,  9,  896 }, { 0xD4,  9,  960 }, { 0xD5,  9, 1024 },
    { 0xD6,  9, 1088 }, { 0xD7,  9, 1152 }, { 0xD8,  9, 1216 }, { 0xD9,  9, 1280 },
    { 0xDA,  9, 1344 }, { 0xDB,  9, 1408 }, { 0x98,  9, 1472 }, { 0x99,  9, 1536 },
    { 0x9A,  9, 1600 }, { 0x18,  6, 1664 }, { 0x9B,  9, 1728 },

    { 0x08, 11, 1792 }, { 0x0C, 11, 1856 }, { 0x0D, 11, 1920 }, { 0x12, 12, 1984 },
    { 0x13, 12, 2048 }, { 0x14, 12, 2112 }, { 0x15, 12, 2176 }, { 0x16, 12, 2240 },
    { 0x17, 12, 2304 }, { 0x1C, 12, 2368 }, { 0x1D, 12, 2432 }, { 0x1E, 12, 2496 },
    { 0x1F, 12, 2560 }
};

const code_t black_codes[] = {
    { 0x37, 10,    0 }, { 0x02,  3,    1 }, { 0x03,  2,    2 }, { 0x02,  2,    3 },
    { 0x03,  3,    4 }, { 0x03,  4,    5 }, { 0x02,  4,    6 }, { 0x03,  5,    7 },
    { 0x05,  6,    8 }, { 0x04,  6,    9 }, { 0x04,  7,   10 }, { 0x05,  7,   11 },
    { 0x07,  7,   12 }, { 0x04,  8,   13 }, { 0x07,  8,   14 }, { 0x18,  9,   15 },
    { 0x17, 10,   16 }, { 0x18, 10,   17 }, { 0x08, 10,   18 }, { 0x67, 11,   19 },
    { 0x68, 11,   20 }, { 0x6C, 11,   21 }, { 0x37, 11,   22 }, { 0x28, 11,   23 },
    { 0x17, 11,   24 }, { 0x18, 11,   25 }, { 0xCA, 12,   26 }, { 0xCB, 12,   27 },
    { 0xCC, 12,   28 }, { 0xCD, 12,   29 }, { 0x68, 12,   30 }, { 0x69, 12,   31 },
    { 0x6A, 12,   32 }, { 0x6B, 12,   33 }, { 0xD2, 12,   34 }, { 0xD3, 12,   35 },
    { 0xD4, 12,   36 }, { 0xD5, 12,   37 }, { 0xD6, 12,   38 }, { 0xD7, 12,   39 },
    { 0x6C, 12,   40 }, { 0x6D, 12,   41 }, { 0xDA, 12,   42 }, { 0xDB, 12,   43 },
    { 0x54, 12,   44 }, { 0x55, 12,   45 }, { 0x56, 12,   46 }, { 0x57, 12,   47 },
    { 0x64, 12,   48 }, { 0x65, 12,   49 }, { 0x52, 12,   50 }, { 0x53, 12,   51 },
    { 0x24, 12,   52 }, { 0x37, 12,   53 }, { 0x38, 12,   54 }, { 0x27, 12,   55 },
    { 0x28, 12,   56 }, { 0x58, 12,   57 }, { 0x59, 12,   58 }, { 0x2B, 12,   59 },
    { 0x2C, 12,   60 }, { 0x5A, 12,   61 }, { 0x66, 12,   62 }, { 0x67, 12,   63 },

    { 0x0F, 10,   64 }, { 0xC8, 12,  128 }, { 0xC9, 12,  192 }, { 0x5B, 12,  256 },
    { 0x33, 12,  320 }, { 0x34, 12,  384 }, { 0x35, 12,  448 }, { 0x6C, 13,  512 },
    { 0x6D, 13,  576 }, { 0x4A, 13,  640 }, { 0x4B, 13,  704 }, { 0x4C, 13,  768 },
    { 0x4D, 13,  832 }, { 0x72, 13,  896 }, { 0x73, 13,  960 }, { 0x74, 13, 1024 },
    { 0x75, 13, 1088 }, { 0x76, 13, 1152 }, { 0x77, 13, 1216 }, { 0x52, 13, 1280 },
    { 0x53, 13, 1344 }, { 0x54, 13, 1408 }, { 0x55, 13, 1472 }, { 0x5A, 13, 1536 },
    { 0x5B, 13, 1600 }, { 0x64, 13, 1664 }, { 0x65, 13, 1728 },

    { 0x08, 11, 1792 }, { 0x0C, 11, 1856 }, { 0x0D, 11, 1920 }, { 0x12, 12, 1984 },
    { 0x13, 12, 2048 }, { 0x14, 12, 2112 }, { 0x15, 12, 2176 }, { 0x16, 12, 2240 },
    { 0x17, 12, 2304 }, { 0x1C, 12, 2368 }, { 0x1D, 12, 2432 }, { 0x1E, 12, 2496 },
    { 0x1F, 12, 2560 }
};

enum struct mode_t { pass, horizontal, v0, vr1, vr2, vr3, vl1, vl2, vl3, eol };

struct mode_code_t
{
    unsigned short code;
    unsigned char  bits;
    mode_t         mode;
};

const mode_code_t mode_codes[] = {
    { 0x1,  1, mode_t::v0         },
    { 0x3,  3, mode_t::vr1        },
    { 0x2,  3, mode_t::vl1        },
    { 0x1,  3, mode_t::horizontal },
    { 0x1,  4, mode_t::pass       },
    { 0x3,  6, mode_t::vr2        },
    { 0x2,  6, mode_t::vl2        },
    { 0x3,  7, mode_t::vr3        },
    { 0x2,  7, mode_t::vl3        },
    { 0x1, 12, mode_t::eol        }
};

struct bit_reader_t
{
    explicit bit_reader_t(const std::string &s)
        : s_(s), size_(s.size() << 3)
    { }

    size_t remaining() const { return size_ - pos_; }

    unsigned peek(size_t n) const
    {
        unsigned x = 0;

        for (size_t i = pos_; i < pos_ + n; ++i) {
            const unsigned bit = i < size_
                ? ((unsigned char)s_[i >> 3] >> (7 - (i & 7))) & 1 : 0;
            x = (x << 1) | bit;
        }

        return x;
    }

    bool match(unsigned code, size_t bits) const
    {
        return remaining() >= bits && peek(bits) == code;
    }

    void skip(size_t n) { pos_ = (std::min)(pos_ + n, size_); }

    void align() { pos_ = (std::min)((pos_ + 7) & ~size_t(7), size_); }

    bool only_zeros() const
    {
        for (size_t i = pos_; i < size_; ++i)
            if (((unsigned char)s_[i >> 3] >> (7 - (i & 7))) & 1)
                return false;

        return true;
    }

private:
    const std::string &s_;
    size_t size_, pos_ = 0;
};

class ccitt_decoder_t
{
public:
    ccitt_decoder_t(const std::string &data, const ccitt_params_t &params)
        : in_(data), params_(params), columns_(params.columns)
    { }

    std::string decode();

private:
    int run_length(bool white);
    mode_t two_dim_mode();

    void one_dim_row(std::vector< int > &);
    void two_dim_row(std::vector< int >, std::vector< int > &);

    void put_row(const std::vector< int > &, std::string &) const;

private:
    bit_reader_t in_;
    const ccitt_params_t &params_;
    int columns_;
};

int ccitt_decoder_t::run_length(bool white)
{
    int total = 0;

    for (;;) {
        auto pred = [&](const auto &x) { return in_.match(x.code, x.bits); };

        const code_t *p = white
            ? find_if(white_codes, pred)
            : find_if(black_codes, pred);

        if (p == (white ? std::end(white_codes) : std::end(black_codes)))
            throw decode_error(white ? "ccitt: bad white run code"
                                     : "ccitt: bad black run code");

        in_.skip(p->bits);
        total += p->run;

        if (p->run < 64)
            return total;
    }
}

mode_t ccitt_decoder_t::two_dim_mode()
{
    auto iter = find_if(mode_codes, [&](const auto &x) {
        return in_.match(x.code, x.bits);
    });

    if (iter == std::end(mode_codes))
        throw decode_error("ccitt: bad 2-D mode code");

    in_.skip(iter->bits);

    return iter->mode;
}

void ccitt_decoder_t::one_dim_row(std::vector< int > &cur)
{
    bool white = true;

    for (int a0 = 0; a0 < columns_; white = !white) {
        a0 = (std::min)(a0 + run_length(white), columns_);
        cur.push_back(a0);
    }
}

//
// Changing elements: even entries are white to black transitions, odd
// entries black to white; the reference line is extended with two
// end-of-line sentinels.
//
void ccitt_decoder_t::two_dim_row(std::vector< int > ref, std::vector< int > &cur)
{
    ref.push_back(columns_);
    ref.push_back(columns_);

    bool white = true;

    for (int a0 = -1; a0 < columns_;) {
        size_t i = 0;

        for (; i < ref.size() && ref[i] <= a0; ++i) ;

        if (i < ref.size() && (i & 1) != (white ? 0U : 1U))
            ++i;

        i = (std::min)(i, ref.size() - 2);

        const int b1 = ref[i], b2 = ref[i + 1];
        const int start = (std::max)(a0, 0);

        int delta = 0;

        switch (two_dim_mode()) {
        case mode_t::pass:
            a0 = b2;
            continue;

        case mode_t::horizontal: {
            const int a1 = (std::min)(start + run_length(white), columns_);
            const int a2 = (std::min)(a1 + run_length(!white), columns_);

            cur.push_back(a1);
            cur.push_back(a2);

            a0 = a2;
        }
            continue;

        case mode_t::eol:
            throw decode_error("ccitt: unexpected end of line");

        case mode_t::v0:  delta =  0; break;
        case mode_t::vr1: delta =  1; break;
        case mode_t::vr2: delta =  2; break;
        case mode_t::vr3: delta =  3; break;
        case mode_t::vl1: delta = -1; break;
        case mode_t::vl2: delta = -2; break;
        case mode_t::vl3: delta = -3; break;
        }

        const int a1 = (std::max)(start, (std::min)(b1 + delta, columns_));

        cur.push_back(a1);

        a0 = a1;
        white = !white;
    }
}

void ccitt_decoder_t::put_row(const std::vector< int > &cur, std::string &out) const
{
    const char white = params_.black_is_1 ? 0 : char(0xFF);
    std::string row((columns_ + 7) >> 3, white);

    for (size_t i = 0; i < cur.size(); i += 2) {
        const int first = cur[i];
        const int last = i + 1 < cur.size() ? cur[i + 1] : columns_;

        for (int x = first; x < (std::min)(last, columns_); ++x) {
            auto &c = row[x >> 3];
            const int mask = 0x80 >> (x & 7);

            c = params_.black_is_1 ? char(c | mask) : char(c & ~mask);
        }
    }

    out += row;
}

std::string ccitt_decoder_t::decode()
{
    if (columns_ <= 0 || columns_ > (1 << 16))
        throw decode_error("ccitt: bad column count");

    std::string out;
    std::vector< int > ref;

    int row = 0;

    for (; params_.rows <= 0 || row < params_.rows; ++row) {
        if (params_.encoded_byte_align)
            in_.align();

        //
        // Fill bits and end-of-line codes; two in a row (or any in Group 4)
        // end the data:
        //
        int eols = 0;

        for (;;) {
            if (in_.remaining() >= 12 && 0 == in_.peek(12))
                in_.skip(1);
            else if (in_.match(0x1, 12))
                in_.skip(12), ++eols;
            else
                break;
        }

        if (eols > 1 || (eols && params_.k < 0))
            break;

        if (in_.only_zeros())
            break;

        bool two_dim = params_.k < 0;

        if (params_.k > 0) {
            two_dim = 0 == in_.peek(1);
            in_.skip(1);
        }

        std::vector< int > cur;

        if (two_dim)
            two_dim_row(ref, cur);
        else
            one_dim_row(cur);

        put_row(cur, out);
        ref = std::move(cur);
    }

    //
    // Truncated data: complete the declared rows with white ones
    //
    for (; row < params_.rows; ++row)
        put_row({ }, out);

    return out;
}

} // anonymous

std::string ccitt_fax_decode(const std::string &data, const ccitt_params_t &params)
{
    return ccitt_decoder_t(data, params).decode();
}

} // namespace pdfdraw
