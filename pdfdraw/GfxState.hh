// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_GFXSTATE_HH
#define PDFDRAW_PDFDRAW_GFXSTATE_HH

#include <defs.hh>

#include <algorithm>
#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pdfdraw {

//------------------------------------------------------------------------
// matrix_t: [a b c d e f]
//------------------------------------------------------------------------

using matrix_t = std::array< double, 6 >;

constexpr matrix_t identity_matrix{ 1, 0, 0, 1, 0, 0 };

//------------------------------------------------------------------------
// colour_t
//------------------------------------------------------------------------

struct colour_t
{
    unsigned char r = 0, g = 0, b = 0, a = 255;
};

inline bool operator==(const colour_t &lhs, const colour_t &rhs)
{
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

inline bool operator!=(const colour_t &lhs, const colour_t &rhs)
{
    return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &, const colour_t &);

// Components in [0,1]; out of range values are clamped.
colour_t gray_colour(double);
colour_t rgb_colour(double, double, double);
colour_t cmyk_colour(double, double, double, double);

colour_t with_alpha(colour_t, double);

//------------------------------------------------------------------------
// Line and fill parameters
//------------------------------------------------------------------------

enum struct line_cap_t { butt, round, projecting };
enum struct line_join_t { miter, round, bevel };
enum struct fill_rule_t { winding, odd_even };

// Colour space of the colour operands of SC/sc/SCN/scn.
enum struct paint_space_t { gray, rgb, cmyk };

std::optional< line_cap_t > make_line_cap(int);
std::optional< line_join_t > make_line_join(int);

const char *to_string(line_cap_t);
const char *to_string(line_join_t);
const char *to_string(fill_rule_t);

//------------------------------------------------------------------------
// GfxPath: device space (y-down) path segments
//------------------------------------------------------------------------

enum struct segment_kind_t { move_to, line_to, curve_to, rectangle, close };

// How the control points of a curve were given: c, v or y.
enum struct curve_variant_t { explicit_, initial_implicit, final_implicit };

struct path_segment_t
{
    segment_kind_t kind;
    curve_variant_t variant = curve_variant_t::explicit_;

    // move_to, line_to: x y; curve_to: x1 y1 x2 y2 x3 y3; rectangle: x y w h
    std::array< double, 6 > xs{ };
};

bool operator==(const path_segment_t &, const path_segment_t &);

inline bool operator!=(const path_segment_t &lhs, const path_segment_t &rhs)
{
    return !(lhs == rhs);
}

using path_t = std::vector< path_segment_t >;

//
// A clipping path is recorded as constructed; it is never intersected with
// the painted area:
//
struct clip_t
{
    path_t path;
    fill_rule_t rule = fill_rule_t::winding;
};

inline bool operator==(const clip_t &lhs, const clip_t &rhs)
{
    return lhs.rule == rhs.rule && lhs.path == rhs.path;
}

//------------------------------------------------------------------------
// Text state
//------------------------------------------------------------------------

struct text_state_t
{
    matrix_t matrix      = identity_matrix; // Tm
    matrix_t line_matrix = identity_matrix; // Tlm

    double char_spacing  = 0; // Tc
    double word_spacing  = 0; // Tw
    double horiz_scaling = 1; // Tz / 100
    double leading       = 0; // TL

    std::string font;      // font resource name
    std::string base_font; // base font of the resource, empty if unresolved
    double      font_size = 0;

    double rise   = 0; // Ts
    int    render = 0; // Tr
};

bool operator==(const text_state_t &, const text_state_t &);

//------------------------------------------------------------------------
// GfxState
//------------------------------------------------------------------------

//
// The current paint and text parameters. A plain value: saving copies it,
// restoring assigns it back, no part of it is shared between copies:
//
struct GfxState
{
    colour_t stroke{ }, fill{ };

    // 0 is transparent, 1 is opaque
    double stroke_alpha = 1, fill_alpha = 1;

    paint_space_t stroke_space = paint_space_t::gray;
    paint_space_t fill_space   = paint_space_t::gray;

    double      line_width = 1;
    line_cap_t  line_cap   = line_cap_t::butt;
    line_join_t line_join  = line_join_t::miter;

    std::vector< double > dash;
    double dash_phase = 0;

    std::optional< double > miter_limit;

    bool stroke_adjust = false;

    // printer-only, stored and never acted upon
    bool overprint = false, overprint_ns = false;
    int  overprint_mode = 0;

    // stored only
    std::string blend_mode;

    std::vector< clip_t > clips;

    text_state_t text;

    GfxState save() const { return *this; }
    void restore(GfxState saved) { *this = std::move(saved); }

    colour_t strokeColorWithAlpha() const { return with_alpha(stroke, stroke_alpha); }
    colour_t fillColorWithAlpha() const { return with_alpha(fill, fill_alpha); }

    //
    // Line width has a floor of 1.0:
    //
    void setLineWidth(double w) { line_width = (std::max)(w, 1.0); }
};

bool operator==(const GfxState &, const GfxState &);

inline bool operator!=(const GfxState &lhs, const GfxState &rhs)
{
    return !(lhs == rhs);
}

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_GFXSTATE_HH
