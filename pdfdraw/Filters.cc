// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <ios>
#include <iterator>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

#include <iostreams/ascii85_input_filter.hh>
#include <iostreams/asciihex_input_filter.hh>
#include <iostreams/lzw_input_filter.hh>
#include <iostreams/predictor_input_filter.hh>

#include <pdfdraw/Filters.hh>

namespace pdfdraw {
namespace {

struct filter_name_t
{
    const char *name;
    const char *abbrev;
    filter_t filter;
};

const filter_name_t filter_names[] = {
    { "LZWDecode",       "LZW", filter_t::lzw       },
    { "ASCIIHexDecode",  "AHx", filter_t::asciihex  },
    { "ASCII85Decode",   "A85", filter_t::ascii85   },
    { "FlateDecode",     "Fl",  filter_t::flate     },
    { "CCITTFaxDecode",  "CCF", filter_t::ccitt_fax },
    { "DCTDecode",       "DCT", filter_t::dct       }
};

//
// Pushes a predictor stage if the parameters ask for one; it sits on the
// reader side of the stage it undoes:
//
void push_predictor(io::filtering_istream &str, const dict_t &parms)
{
    const int predictor = int_value(parms, "Predictor", 1);

    if (predictor <= 1)
        return;

    str.push(iostreams::predictor_input_filter_t(
        predictor,
        int_value(parms, "Columns", 1),
        int_value(parms, "Colors", 1),
        int_value(parms, "BitsPerComponent", 8)));
}

std::string read_all(std::istream &str)
{
    std::string buf;

    char tmp[4096];

    while (str.read(tmp, sizeof tmp), str.gcount() > 0)
        buf.append(tmp, size_t(str.gcount()));

    return buf;
}

} // anonymous

filter_t make_filter(const std::string &s)
{
    auto iter = find_if(filter_names, [&](const auto &x) {
        return s == x.name || s == x.abbrev;
    });

    return iter == std::end(filter_names) ? filter_t::unsupported : iter->filter;
}

const char *to_string(filter_t x)
{
    auto iter = find_if(filter_names, [&](const auto &y) {
        return y.filter == x;
    });

    return iter == std::end(filter_names) ? "unsupported" : iter->name;
}

bool filter_chain_t::has(filter_t x) const
{
    return any_of(names, [&](const auto &s) { return make_filter(s) == x; });
}

const dict_t &filter_chain_t::parms_of(filter_t x) const
{
    static const dict_t empty;

    for (size_t i = 0; i < names.size() && i < parms.size(); ++i)
        if (make_filter(names[i]) == x)
            return parms[i];

    return empty;
}

ccitt_params_t make_ccitt_params(const dict_t &parms)
{
    ccitt_params_t params;

    params.k                  = int_value(parms, "K", 0);
    params.columns            = int_value(parms, "Columns", 1728);
    params.rows               = int_value(parms, "Rows", 0);
    params.black_is_1         = bool_value(parms, "BlackIs1", false);
    params.encoded_byte_align = bool_value(parms, "EncodedByteAlign", false);
    params.end_of_block       = bool_value(parms, "EndOfBlock", true);

    return params;
}

std::string default_ccitt_fax(const std::string &data, const dict_t &parms)
{
    return ccitt_fax_decode(data, make_ccitt_params(parms));
}

std::string decode_filters(const std::string &data, const filter_chain_t &chain,
                           const filter_codecs_t &codecs)
{
    for (auto &name : chain.names)
        if (make_filter(name) == filter_t::unsupported)
            throw unsupported_filter_error(name);

    const bool lzw   = chain.has(filter_t::lzw);
    const bool ahx   = chain.has(filter_t::asciihex);
    const bool a85   = chain.has(filter_t::ascii85);
    const bool flate = chain.has(filter_t::flate);

    std::string buf;

    if (lzw || ahx || a85 || flate) {
        try {
            io::filtering_istream str;

            //
            // The stage nearest to the reader goes first:
            //
            if (flate) {
                push_predictor(str, chain.parms_of(filter_t::flate));
                str.push(io::zlib_decompressor());
            }

            if (a85)
                str.push(iostreams::ascii85_input_filter_t());

            if (ahx)
                str.push(iostreams::asciihex_input_filter_t());

            if (lzw) {
                const auto &parms = chain.parms_of(filter_t::lzw);

                push_predictor(str, parms);
                str.push(iostreams::lzw_input_filter_t(
                    1 == int_value(parms, "EarlyChange", 1)));
            }

            str.push(io::array_source(data.data(), data.size()));
            str.exceptions(std::ios_base::badbit);

            buf = read_all(str);
        }
        catch (const std::ios_base::failure &e) {
            throw decode_error(e.what());
        }
    }
    else {
        buf = data;
    }

    if (chain.has(filter_t::ccitt_fax)) {
        if (!codecs.ccitt_fax)
            throw unsupported_filter_error(to_string(filter_t::ccitt_fax));

        buf = codecs.ccitt_fax(buf, chain.parms_of(filter_t::ccitt_fax));
    }

    return buf;
}

} // namespace pdfdraw
