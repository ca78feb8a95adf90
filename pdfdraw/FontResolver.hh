// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_FONTRESOLVER_HH
#define PDFDRAW_PDFDRAW_FONTRESOLVER_HH

#include <defs.hh>

#include <set>
#include <string>

#include <pdfdraw/DrawCommand.hh>

namespace pdfdraw {

//
// Removes a subset tag (ABCDEF+) from a base font name:
//
std::string strip_subset_tag(const std::string &);

//
// Guesses a rasterizer font from a PDF base font name. Unrecognised names
// are collected, once each, for the whole document session.
//
class FontResolver
{
public:
    font_t resolve(const std::string &base_font, double size);

    const std::set< std::string > &missing() const { return missing_; }

private:
    std::set< std::string > missing_;
};

//
// The font with its size multiplied by a host scale factor:
//
font_t scaled(font_t, double);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_FONTRESOLVER_HH
