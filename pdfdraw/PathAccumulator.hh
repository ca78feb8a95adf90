// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_PATHACCUMULATOR_HH
#define PDFDRAW_PDFDRAW_PATHACCUMULATOR_HH

#include <defs.hh>

#include <optional>

#include <pdfdraw/DrawCommand.hh>
#include <pdfdraw/GfxState.hh>

namespace pdfdraw {

//
// Path painting operators:
//
enum struct paint_op_t {
    s, S, f, F, f_star, b, B, b_star, B_star, n
};

struct paint_t
{
    bool close, stroke, fill;
    fill_rule_t rule;
};

//
// Stroke, fill and fill rule of a painting operator:
//
paint_t make_paint(paint_op_t);

std::optional< paint_op_t > make_paint_op(const std::string &);

//
// Collects the segments of the current path, in device space: every y
// coordinate is negated on the way in.
//
class PathAccumulator
{
public:
    void moveTo(double x, double y);
    void lineTo(double x, double y);

    // c
    void curveTo(double x1, double y1, double x2, double y2, double x3, double y3);

    // v: the first control point is the current point
    void curveTo1(double x2, double y2, double x3, double y3);

    // y: the second control point is the end point
    void curveTo2(double x1, double y1, double x3, double y3);

    void rectangle(double x, double y, double w, double h);
    void closePath();

    bool empty() const { return path_.empty(); }
    const path_t &path() const { return path_; }

    //
    // Takes the path away, e.g., for a clipping path:
    //
    path_t release();

    //
    // Emits the pen, the brush, and the path for a painting operator; the
    // path is cleared in all cases. An empty path yields no commands.
    //
    draw_list_t resolve(paint_op_t, const GfxState &);

    void clear();

private:
    path_t path_;

    // current point, device space
    double cur_x_ = 0, cur_y_ = 0;
};

draw_command_t make_pen_command(const GfxState &, bool stroke);
draw_command_t make_brush_command(const GfxState &, bool fill);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_PATHACCUMULATOR_HH
