// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <iterator>

#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

#include <pdfdraw/PathAccumulator.hh>

namespace pdfdraw {
namespace {

struct paint_entry_t
{
    const char *name;
    paint_op_t op;
    paint_t paint;
};

const paint_entry_t paint_table[] = {
    { "s",  paint_op_t::s,      {  true,  true, false, fill_rule_t::winding  } },
    { "S",  paint_op_t::S,      { false,  true, false, fill_rule_t::winding  } },
    { "f",  paint_op_t::f,      { false, false,  true, fill_rule_t::winding  } },
    { "F",  paint_op_t::F,      { false, false,  true, fill_rule_t::winding  } },
    { "f*", paint_op_t::f_star, { false, false,  true, fill_rule_t::odd_even } },
    { "b",  paint_op_t::b,      {  true,  true,  true, fill_rule_t::winding  } },
    { "B",  paint_op_t::B,      { false,  true,  true, fill_rule_t::winding  } },
    { "b*", paint_op_t::b_star, {  true,  true,  true, fill_rule_t::odd_even } },
    { "B*", paint_op_t::B_star, { false,  true,  true, fill_rule_t::odd_even } },
    { "n",  paint_op_t::n,      { false, false, false, fill_rule_t::winding  } }
};

path_segment_t make_segment(segment_kind_t kind, std::array< double, 6 > xs,
                            curve_variant_t variant = curve_variant_t::explicit_)
{
    return path_segment_t{ kind, variant, xs };
}

} // anonymous

paint_t make_paint(paint_op_t op)
{
    return find_if(paint_table, [&](auto &x) { return x.op == op; })->paint;
}

std::optional< paint_op_t > make_paint_op(const std::string &s)
{
    auto iter = find_if(paint_table, [&](auto &x) { return s == x.name; });

    if (iter == std::end(paint_table))
        return { };

    return iter->op;
}

void PathAccumulator::moveTo(double x, double y)
{
    path_.push_back(make_segment(segment_kind_t::move_to, { x, -y }));
    cur_x_ = x, cur_y_ = -y;
}

void PathAccumulator::lineTo(double x, double y)
{
    path_.push_back(make_segment(segment_kind_t::line_to, { x, -y }));
    cur_x_ = x, cur_y_ = -y;
}

void PathAccumulator::curveTo(
    double x1, double y1, double x2, double y2, double x3, double y3)
{
    path_.push_back(make_segment(
        segment_kind_t::curve_to, { x1, -y1, x2, -y2, x3, -y3 }));

    cur_x_ = x3, cur_y_ = -y3;
}

void PathAccumulator::curveTo1(double x2, double y2, double x3, double y3)
{
    path_.push_back(make_segment(
        segment_kind_t::curve_to, { cur_x_, cur_y_, x2, -y2, x3, -y3 },
        curve_variant_t::initial_implicit));

    cur_x_ = x3, cur_y_ = -y3;
}

void PathAccumulator::curveTo2(double x1, double y1, double x3, double y3)
{
    path_.push_back(make_segment(
        segment_kind_t::curve_to, { x1, -y1, x3, -y3, x3, -y3 },
        curve_variant_t::final_implicit));

    cur_x_ = x3, cur_y_ = -y3;
}

//
// In device space the rectangle spans [-y - h, -y] vertically; a negative
// height spans the same rows from the other side:
//
void PathAccumulator::rectangle(double x, double y, double w, double h)
{
    if (h < 0)
        path_.push_back(make_segment(segment_kind_t::rectangle, { x, -y, w, -h }));
    else
        path_.push_back(make_segment(segment_kind_t::rectangle, { x, -y - h, w, h }));

    cur_x_ = x, cur_y_ = -y;
}

void PathAccumulator::closePath()
{
    path_.push_back(make_segment(segment_kind_t::close, { }));
}

path_t PathAccumulator::release()
{
    path_t tmp;
    tmp.swap(path_);

    return tmp;
}

void PathAccumulator::clear()
{
    path_.clear();
}

draw_command_t make_pen_command(const GfxState &state, bool stroke)
{
    pen_t pen;

    if (stroke) {
        pen.colour = state.strokeColorWithAlpha();
        pen.width  = state.line_width;
        pen.cap    = state.line_cap;
        pen.join   = state.line_join;
        pen.dashes = state.dash;
    } else {
        pen.transparent = true;
    }

    return make_command(draw_op_t::SetPen, { pen });
}

draw_command_t make_brush_command(const GfxState &state, bool fill)
{
    brush_t brush;

    if (fill)
        brush.colour = state.fillColorWithAlpha();
    else
        brush.transparent = true;

    return make_command(draw_op_t::SetBrush, { brush });
}

draw_list_t PathAccumulator::resolve(paint_op_t op, const GfxState &state)
{
    const auto paint = make_paint(op);

    if (paint.close && !path_.empty())
        closePath();

    draw_list_t xs;

    if (!path_.empty()) {
        xs.push_back(make_pen_command(state, paint.stroke));
        xs.push_back(make_brush_command(state, paint.fill));
        xs.push_back(make_command(draw_op_t::CreatePath));

        for (auto &seg : path_) {
            auto &v = seg.xs;

            switch (seg.kind) {
            case segment_kind_t::move_to:
                xs.push_back(make_command(draw_op_t::MoveTo, { v[0], v[1] }));
                break;

            case segment_kind_t::line_to:
                xs.push_back(make_command(draw_op_t::LineTo, { v[0], v[1] }));
                break;

            case segment_kind_t::curve_to:
                xs.push_back(make_command(
                    draw_op_t::CurveTo, { v[0], v[1], v[2], v[3], v[4], v[5] }));
                break;

            case segment_kind_t::rectangle:
                xs.push_back(make_command(
                    draw_op_t::AddRectangle, { v[0], v[1], v[2], v[3] }));
                break;

            case segment_kind_t::close:
                xs.push_back(make_command(draw_op_t::ClosePath));
                break;
            }
        }

        xs.push_back(make_command(draw_op_t::DrawPath, { paint.rule }));
    }

    clear();

    return xs;
}

} // namespace pdfdraw
