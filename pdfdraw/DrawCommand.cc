// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <tuple>

#include <pdfdraw/DrawCommand.hh>

namespace pdfdraw {

const char *to_string(draw_op_t x)
{
    static const char *arr[] = {
        "ConcatTransform", "PushState", "PopState", "SetFont", "SetPen",
        "SetBrush", "DrawText", "DrawBitmap", "CreatePath", "MoveTo",
        "LineTo", "CurveTo", "AddRectangle", "ClosePath", "DrawPath"
    };

    return arr[size_t(x)];
}

const char *to_string(font_family_t x)
{
    static const char *arr[] = { "default", "modern", "roman", "swiss" };
    return arr[size_t(x)];
}

bool operator==(const font_t &lhs, const font_t &rhs)
{
    auto tie = [](const font_t &x) {
        return std::tie(x.face, x.family, x.weight, x.style, x.size, x.known);
    };

    return tie(lhs) == tie(rhs);
}

bool operator==(const pen_t &lhs, const pen_t &rhs)
{
    auto tie = [](const pen_t &x) {
        return std::tie(x.colour, x.width, x.cap, x.join, x.dashes,
                        x.transparent);
    };

    return tie(lhs) == tie(rhs);
}

bool operator==(const brush_t &lhs, const brush_t &rhs)
{
    return lhs.colour == rhs.colour && lhs.transparent == rhs.transparent;
}

namespace {

struct printer_t
{
    std::ostream &ss;

    void operator()(double x) const { ss << x; }
    void operator()(const std::string &x) const { ss << "(" << x << ")"; }

    void operator()(const font_t &x) const
    {
        ss << "font(" << x.face << " " << to_string(x.family) << " "
           << x.size
           << (x.weight == font_weight_t::bold ? " bold" : "")
           << (x.style == font_style_t::italic ? " italic" : "") << ")";
    }

    void operator()(const colour_t &x) const { ss << x; }

    void operator()(const pen_t &x) const
    {
        if (x.transparent) {
            ss << "pen(transparent)";
            return;
        }

        ss << "pen(" << x.colour << " " << x.width << " " << to_string(x.cap)
           << " " << to_string(x.join);

        for (auto d : x.dashes)
            ss << " " << d;

        ss << ")";
    }

    void operator()(const brush_t &x) const
    {
        if (x.transparent)
            ss << "brush(transparent)";
        else
            ss << "brush(" << x.colour << ")";
    }

    void operator()(const bitmap_ptr &x) const
    {
        if (x)
            ss << *x;
        else
            ss << "bitmap(null)";
    }

    void operator()(fill_rule_t x) const { ss << to_string(x); }
};

} // anonymous

std::ostream &operator<<(std::ostream &ss, const arg_t &arg)
{
    std::visit(printer_t{ ss }, arg);
    return ss;
}

draw_command_t make_command(draw_op_t op, std::vector< arg_t > args)
{
    return draw_command_t{ op, std::move(args), { } };
}

std::ostream &operator<<(std::ostream &ss, const draw_command_t &cmd)
{
    ss << to_string(cmd.op);

    for (auto &arg : cmd.args)
        ss << " " << arg;

    for (auto &[key, value] : cmd.kwargs)
        ss << " " << key << "=" << value;

    return ss;
}

std::ostream &operator<<(std::ostream &ss, const draw_list_t &xs)
{
    for (auto &x : xs)
        ss << x << "\n";

    return ss;
}

} // namespace pdfdraw
