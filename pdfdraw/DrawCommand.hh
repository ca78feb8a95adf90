// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_DRAWCOMMAND_HH
#define PDFDRAW_PDFDRAW_DRAWCOMMAND_HH

#include <defs.hh>

#include <iostream>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <pdfdraw/Bitmap.hh>
#include <pdfdraw/GfxState.hh>

namespace pdfdraw {

//
// The closed set of rasterizer primitives:
//
enum struct draw_op_t {
    ConcatTransform,
    PushState,
    PopState,
    SetFont,
    SetPen,
    SetBrush,
    DrawText,
    DrawBitmap,
    CreatePath,
    MoveTo,
    LineTo,
    CurveTo,
    AddRectangle,
    ClosePath,
    DrawPath
};

const char *to_string(draw_op_t);

enum struct font_family_t { default_, modern, roman, swiss };
enum struct font_weight_t { normal, bold };
enum struct font_style_t { normal, italic };

const char *to_string(font_family_t);

struct font_t
{
    std::string   face;
    font_family_t family = font_family_t::swiss;
    font_weight_t weight = font_weight_t::normal;
    font_style_t  style  = font_style_t::normal;
    double        size   = 1;

    // false for a guess made for an unrecognised base font
    bool known = false;
};

bool operator==(const font_t &, const font_t &);

struct pen_t
{
    colour_t    colour;
    double      width = 1;
    line_cap_t  cap  = line_cap_t::butt;
    line_join_t join = line_join_t::miter;

    std::vector< double > dashes;

    bool transparent = false;
};

bool operator==(const pen_t &, const pen_t &);

struct brush_t
{
    colour_t colour;
    bool transparent = false;
};

bool operator==(const brush_t &, const brush_t &);

using arg_t = std::variant<
    double, std::string, font_t, colour_t, pen_t, brush_t, bitmap_ptr,
    fill_rule_t >;

std::ostream &operator<<(std::ostream &, const arg_t &);

//
// One rasterizer instruction with positional and named arguments:
//
//   ConcatTransform a b c d e f
//   SetFont         font colour
//   SetPen          pen
//   SetBrush        brush
//   DrawText        text x y                    font= colour=
//   DrawBitmap      bitmap x y width height     [folded=]
//   MoveTo, LineTo  x y
//   CurveTo         x1 y1 x2 y2 x3 y3
//   AddRectangle    x y width height
//   DrawPath        fill rule
//
struct draw_command_t
{
    draw_op_t op;

    std::vector< arg_t > args;
    std::map< std::string, arg_t > kwargs;

    template< typename T >
    const T &arg(size_t n) const { return std::get< T >(args.at(n)); }

    double num(size_t n) const { return arg< double >(n); }

    bool has(const char *key) const { return kwargs.count(key); }
};

using draw_list_t = std::vector< draw_command_t >;

draw_command_t make_command(draw_op_t, std::vector< arg_t > = { });

std::ostream &operator<<(std::ostream &, const draw_command_t &);
std::ostream &operator<<(std::ostream &, const draw_list_t &);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_DRAWCOMMAND_HH
