// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfdraw/Error.hh>
#include <pdfdraw/FTTextMetrics.hh>
#include <pdfdraw/FontResolver.hh>

namespace pdfdraw {
namespace {

// Average advance, ascent and descent of a Latin text face, in em.
const double average_advance = 0.5;
const double average_ascent  = 0.8;
const double average_descent = 0.2;

} // anonymous

FTTextMetrics::FTTextMetrics(const GlobalParams &params)
    : params(params)
{
    if (FT_Init_FreeType(&lib)) {
        error(errInternal, -1, "Couldn't initialize FreeType");
        lib = 0;
    }
}

FTTextMetrics::~FTTextMetrics()
{
    for (auto &[name, face] : faces)
        if (face)
            FT_Done_Face(face);

    if (lib)
        FT_Done_FreeType(lib);
}

FT_Face FTTextMetrics::face(const std::string &name) const
{
    auto iter = faces.find(name);

    if (iter != faces.end())
        return iter->second;

    FT_Face ftFace = 0;

    if (lib) {
        auto path = params.findFontFile(name);

        if (!path)
            path = params.findFontFile(strip_subset_tag(name));

        if (path && FT_New_Face(lib, path->c_str(), 0, &ftFace)) {
            error(errIO, -1, "Couldn't load font file '{0:s}' for '{1:s}'",
                  *path, name);
            ftFace = 0;
        }
    }

    return faces[name] = ftFace;
}

//
// Sum of the unscaled glyph advances, in em:
//
double FTTextMetrics::advance(FT_Face ftFace, const std::string &s) const
{
    const double upem = ftFace->units_per_EM ? ftFace->units_per_EM : 1000;

    double w = 0;

    for (unsigned char c : s) {
        const FT_UInt gid = FT_Get_Char_Index(ftFace, c);

        if (FT_Load_Glyph(ftFace, gid, FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING))
            w += average_advance * upem;
        else
            w += ftFace->glyph->metrics.horiAdvance;
    }

    return w / upem;
}

text_extent_t FTTextMetrics::extent(const std::string &s, const font_t &font) const
{
    text_extent_t ext;

    if (FT_Face ftFace = face(font.face)) {
        const double upem = ftFace->units_per_EM ? ftFace->units_per_EM : 1000;

        ext.width   = advance(ftFace, s) * font.size;
        ext.height  = (ftFace->ascender - ftFace->descender) / upem * font.size;
        ext.descent = -ftFace->descender / upem * font.size;
    } else {
        ext.width   = average_advance * s.size() * font.size;
        ext.height  = (average_ascent + average_descent) * font.size;
        ext.descent = average_descent * font.size;
    }

    return ext;
}

std::optional< double >
FTTextMetrics::width(const std::string &s, const std::string &base_font,
                     double size) const
{
    if (FT_Face ftFace = face(base_font))
        return advance(ftFace, s) * size;

    return { };
}

} // namespace pdfdraw
