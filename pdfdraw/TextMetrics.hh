// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_TEXTMETRICS_HH
#define PDFDRAW_PDFDRAW_TEXTMETRICS_HH

#include <defs.hh>

#include <optional>
#include <string>

#include <pdfdraw/DrawCommand.hh>

namespace pdfdraw {

struct text_extent_t
{
    double width = 0, height = 0, descent = 0;
};

//
// Text measurement provided by the host:
//
struct TextMetrics
{
    virtual ~TextMetrics() = default;

    //
    // Extent of a string in a rasterizer font, as the device reports it:
    //
    virtual text_extent_t extent(const std::string &, const font_t &) const = 0;

    //
    // Advance width of a string in a PDF base font at the given size, if the
    // provider has the font:
    //
    virtual std::optional< double >
    width(const std::string &, const std::string & /* base_font */,
          double /* size */) const
    {
        return { };
    }
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_TEXTMETRICS_HH
