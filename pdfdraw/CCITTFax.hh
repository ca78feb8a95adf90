// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_CCITTFAX_HH
#define PDFDRAW_PDFDRAW_CCITTFAX_HH

#include <defs.hh>

#include <string>

namespace pdfdraw {

struct ccitt_params_t
{
    // < 0: Group 4; 0: Group 3 1-D; > 0: Group 3 mixed 1-D/2-D
    int k = 0;

    int columns = 1728;

    // 0: as many rows as the data holds
    int rows = 0;

    bool black_is_1 = false;
    bool encoded_byte_align = false;
    bool end_of_block = true;
};

//
// Decodes CCITT Group 3 or Group 4 data into rows of packed 1-bit samples,
// each row padded to a byte boundary. With black_is_1 unset a white pixel is
// a 1 bit. Throws decode_error on malformed data.
//
std::string ccitt_fax_decode(const std::string &, const ccitt_params_t &);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_CCITTFAX_HH
