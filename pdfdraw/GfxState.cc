// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cmath>
#include <tuple>

#include <pdfdraw/GfxState.hh>

namespace pdfdraw {
namespace {

inline unsigned char to_byte(double x)
{
    x = x < 0 ? 0 : x > 1 ? 1 : x;
    return (unsigned char)std::lround(x * 255);
}

} // anonymous

std::ostream &operator<<(std::ostream &ss, const colour_t &c)
{
    return ss << "rgba(" << unsigned(c.r) << "," << unsigned(c.g) << ","
              << unsigned(c.b) << "," << unsigned(c.a) << ")";
}

colour_t gray_colour(double x)
{
    const auto c = to_byte(x);
    return { c, c, c };
}

colour_t rgb_colour(double r, double g, double b)
{
    return { to_byte(r), to_byte(g), to_byte(b) };
}

colour_t cmyk_colour(double c, double m, double y, double k)
{
    auto clamp = [](double x) { return x < 0 ? 0 : x > 1 ? 1 : x; };

    c = clamp(c);
    m = clamp(m);
    y = clamp(y);
    k = clamp(k);

    return rgb_colour((1 - c) * (1 - k), (1 - m) * (1 - k), (1 - y) * (1 - k));
}

colour_t with_alpha(colour_t c, double alpha)
{
    c.a = to_byte(alpha);
    return c;
}

std::optional< line_cap_t > make_line_cap(int n)
{
    switch (n) {
    case 0: return line_cap_t::butt;
    case 1: return line_cap_t::round;
    case 2: return line_cap_t::projecting;
    default:
        return { };
    }
}

std::optional< line_join_t > make_line_join(int n)
{
    switch (n) {
    case 0: return line_join_t::miter;
    case 1: return line_join_t::round;
    case 2: return line_join_t::bevel;
    default:
        return { };
    }
}

const char *to_string(line_cap_t x)
{
    static const char *arr[] = { "butt", "round", "projecting" };
    return arr[size_t(x)];
}

const char *to_string(line_join_t x)
{
    static const char *arr[] = { "miter", "round", "bevel" };
    return arr[size_t(x)];
}

const char *to_string(fill_rule_t x)
{
    static const char *arr[] = { "winding", "odd-even" };
    return arr[size_t(x)];
}

bool operator==(const path_segment_t &lhs, const path_segment_t &rhs)
{
    return lhs.kind == rhs.kind && lhs.variant == rhs.variant &&
           lhs.xs == rhs.xs;
}

bool operator==(const text_state_t &lhs, const text_state_t &rhs)
{
    auto tie = [](const text_state_t &x) {
        return std::tie(x.matrix, x.line_matrix, x.char_spacing,
                        x.word_spacing, x.horiz_scaling, x.leading, x.font,
                        x.base_font, x.font_size, x.rise, x.render);
    };

    return tie(lhs) == tie(rhs);
}

bool operator==(const GfxState &lhs, const GfxState &rhs)
{
    auto tie = [](const GfxState &x) {
        return std::tie(x.stroke, x.fill, x.stroke_alpha, x.fill_alpha,
                        x.stroke_space, x.fill_space, x.line_width, x.line_cap,
                        x.line_join, x.dash, x.dash_phase, x.miter_limit,
                        x.stroke_adjust, x.overprint, x.overprint_ns,
                        x.overprint_mode, x.blend_mode, x.clips, x.text);
    };

    return tie(lhs) == tie(rhs);
}

} // namespace pdfdraw
