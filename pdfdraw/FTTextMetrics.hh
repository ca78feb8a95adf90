// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_FTTEXTMETRICS_HH
#define PDFDRAW_PDFDRAW_FTTEXTMETRICS_HH

#include <defs.hh>

#include <map>
#include <string>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <pdfdraw/GlobalParams.hh>
#include <pdfdraw/TextMetrics.hh>

namespace pdfdraw {

//------------------------------------------------------------------------
// FTTextMetrics
//------------------------------------------------------------------------

//
// Measures text with the FreeType faces named by `fontFile' settings, looked
// up by base font name or by rasterizer face name. Without a face, widths
// are estimated from an average advance.
//
class FTTextMetrics : public TextMetrics
{
public:
    explicit FTTextMetrics(const GlobalParams &);
    ~FTTextMetrics();

    FTTextMetrics(const FTTextMetrics &) = delete;
    FTTextMetrics &operator=(const FTTextMetrics &) = delete;

    text_extent_t extent(const std::string &, const font_t &) const override;

    std::optional< double >
    width(const std::string &, const std::string &, double) const override;

private:
    FT_Face face(const std::string &) const;

    double advance(FT_Face, const std::string &) const;

private:
    const GlobalParams &params;

    FT_Library lib = 0;

    // font name -> face, null for a file which failed to load
    mutable std::map< std::string, FT_Face > faces;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_FTTEXTMETRICS_HH
