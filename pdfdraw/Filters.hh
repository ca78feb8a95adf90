// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_FILTERS_HH
#define PDFDRAW_PDFDRAW_FILTERS_HH

#include <defs.hh>

#include <functional>
#include <string>
#include <vector>

#include <pdfdraw/CCITTFax.hh>
#include <pdfdraw/Error.hh>
#include <pdfdraw/obj.hh>

namespace pdfdraw {

enum struct filter_t {
    lzw, asciihex, ascii85, flate, ccitt_fax, dct, unsupported
};

//
// Maps full (FlateDecode) and abbreviated (Fl) filter names:
//
filter_t make_filter(const std::string &);

const char *to_string(filter_t);

//
// A filter named in a chain which has no decoder:
//
struct unsupported_filter_error : decode_error
{
    explicit unsupported_filter_error(const std::string &name)
        : decode_error("unsupported filter: " + name), name(name)
    { }

    std::string name;
};

using codec_t = std::function< std::string(const std::string &, const dict_t &) >;

ccitt_params_t make_ccitt_params(const dict_t &);

std::string default_ccitt_fax(const std::string &, const dict_t &);

//
// Decoders the host may replace:
//
struct filter_codecs_t
{
    codec_t ccitt_fax = default_ccitt_fax;
};

//
// An ordered filter chain with one (possibly empty) parameter dictionary per
// filter:
//
struct filter_chain_t
{
    std::vector< std::string > names;
    std::vector< dict_t > parms;

    bool has(filter_t) const;
    const dict_t &parms_of(filter_t) const;
};

//
// Runs the stages present in the chain in the fixed order LZW, ASCIIHex,
// ASCII85, Flate, CCITT-Fax, each stage feeding the next. DCT data is left
// encoded. Throws decode_error on malformed data and unsupported_filter_error
// on a filter without a decoder.
//
std::string decode_filters(const std::string &, const filter_chain_t &,
                           const filter_codecs_t & = { });

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_FILTERS_HH
