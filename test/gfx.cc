// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE gfx

#include <defs.hh>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <range/v3/algorithm/count_if.hpp>
using namespace ranges;

#include <pdfdraw/Error.hh>
#include <pdfdraw/Gfx.hh>

BOOST_TEST_DONT_PRINT_LOG_VALUE(std::vector< double >)

namespace {

using namespace pdfdraw;

//
// Every glyph is half an em wide; the height is one em, the descent a fifth:
//
struct fake_metrics_t : TextMetrics
{
    text_extent_t extent(const std::string &s, const font_t &font) const override
    {
        return { 0.5 * font.size * s.size(), font.size, 0.2 * font.size };
    }
};

//
// Knows the precise widths of Helvetica:
//
struct precise_metrics_t : fake_metrics_t
{
    std::optional< double >
    width(const std::string &s, const std::string &base_font,
          double size) const override
    {
        if (base_font == "Helvetica")
            return 0.25 * size * s.size();

        return { };
    }
};

//
// Collects the messages reported while it lives:
//
struct error_log_t
{
    error_log_t()
    {
        setErrorCallback([this](ErrorCategory category, long, const std::string &s) {
            xs.emplace_back(category, s);
        });
    }

    ~error_log_t() { setErrorCallback({ }); }

    error_log_t(const error_log_t &) = delete;
    error_log_t &operator=(const error_log_t &) = delete;

    size_t count(const char *what) const
    {
        return count_if(xs, [&](auto &x) {
            return std::string::npos != x.second.find(what);
        });
    }

    size_t count(ErrorCategory category) const
    {
        return count_if(xs, [&](auto &x) { return x.first == category; });
    }

    std::vector< std::pair< ErrorCategory, std::string > > xs;
};

operation_t op(const char *name, std::vector< obj_t > args = { })
{
    return operation_t{ std::move(args), name };
}

obj_t name_obj(const char *s)
{
    return make_name_obj(s);
}

obj_t array_obj(std::vector< obj_t > xs)
{
    return obj_t(array_t(std::move(xs)));
}

size_t count_ops(const draw_list_t &xs, draw_op_t what)
{
    return count_if(xs, [&](auto &x) { return x.op == what; });
}

std::vector< draw_command_t > only(const draw_list_t &xs, draw_op_t what)
{
    std::vector< draw_command_t > ys;

    for (auto &x : xs)
        if (x.op == what)
            ys.push_back(x);

    return ys;
}

image_ptr rgb_image(int width, int height, std::string data)
{
    auto p = std::make_shared< image_t >();

    p->width = width;
    p->height = height;
    p->bits = 8;
    p->colour_space.kind = colour_space_kind_t::device_rgb;
    p->colour_space.name = "DeviceRGB";
    p->data = std::move(data);

    return p;
}

form_ptr make_form(std::vector< operation_t > ops,
                   std::optional< matrix_t > matrix = { })
{
    auto p = std::make_shared< form_t >();

    p->ops = std::move(ops);
    p->bbox = { 0, 0, 100, 100 };
    p->matrix = matrix;

    return p;
}

struct interpreter_t
{
    interpreter_t()
    {
        res->scope = "page 1";
        res->fonts["F1"] = "Helvetica";
    }

    Gfx make() { return Gfx(params, metrics, cache, fonts, res); }

    draw_list_t run(const std::vector< operation_t > &ops)
    {
        auto gfx = make();
        return gfx.display(ops);
    }

    GlobalParams params;
    fake_metrics_t metrics;
    FormCache cache;
    FontResolver fonts;

    std::shared_ptr< Resources > res = std::make_shared< Resources >();

    error_log_t log;
};

} // anonymous

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(operators)

BOOST_AUTO_TEST_CASE(table_is_sorted)
{
    for (size_t i = 1; i < Gfx::numOps; ++i)
        BOOST_TEST(strcmp(Gfx::opTab[i - 1].name, Gfx::opTab[i].name) < 0);
}

BOOST_AUTO_TEST_CASE(find_operator)
{
    auto p = Gfx::findOp("re");

    BOOST_TEST_REQUIRE(p);
    BOOST_TEST((p->op == Gfx::op_t::rectangle));
    BOOST_TEST(p->numArgs == 4);

    BOOST_TEST(Gfx::findOp("\""));
    BOOST_TEST(Gfx::findOp("y"));
    BOOST_TEST(Gfx::findOp("BDC"));

    BOOST_TEST(!Gfx::findOp("zz"));
    BOOST_TEST(!Gfx::findOp(""));
    BOOST_TEST(!Gfx::findOp("BIX"));
}

BOOST_AUTO_TEST_CASE(unknown_operator_reported_once)
{
    interpreter_t t;

    const auto xs = t.run({ op("foo"), op("foo"), op("q"), op("Q") });

    BOOST_TEST(t.log.count("Unknown operator 'foo'") == 1U);
    BOOST_TEST(count_ops(xs, draw_op_t::PushState) == 1U);
}

BOOST_AUTO_TEST_CASE(unknown_operator_in_compatibility_section)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = gfx.display({
        op("BX"), op("bar"), op("BX"), op("EX"), op("baz"), op("EX"), op("qux")
    });

    BOOST_TEST(!gfx.getReported().seen("op:bar"));
    BOOST_TEST(!gfx.getReported().seen("op:baz"));
    BOOST_TEST(gfx.getReported().seen("op:qux"));
    BOOST_TEST(t.log.count(errSyntaxError) == 1U);
}

BOOST_AUTO_TEST_CASE(too_few_arguments)
{
    interpreter_t t;

    const auto xs = t.run({ op("m", { 1. }), op("S") });

    BOOST_TEST(t.log.count("Too few") == 1U);
    BOOST_TEST(xs.empty());
}

BOOST_AUTO_TEST_CASE(surplus_arguments_dropped_from_the_front)
{
    interpreter_t t;

    auto gfx = t.make();
    static_cast< void >(gfx.display({ op("w", { 1., 2., 5. }) }));

    BOOST_TEST(gfx.getState().line_width == 5);
    BOOST_TEST(t.log.xs.empty());
}

BOOST_AUTO_TEST_CASE(too_many_arguments)
{
    interpreter_t t;

    auto gfx = t.make();
    static_cast< void >(gfx.display({ op("sc", { 1., 1., 1., 1., 1. }) }));

    BOOST_TEST(t.log.count("Too many") == 1U);
    BOOST_TEST(gfx.getState().fill == (colour_t{ 0, 0, 0 }));
}

BOOST_AUTO_TEST_CASE(wrong_argument_type)
{
    interpreter_t t;

    auto gfx = t.make();
    static_cast< void >(gfx.display({ op("w", { name_obj("Foo") }), op("J", { 1.5 }) }));

    BOOST_TEST(t.log.count("wrong type") == 2U);
    BOOST_TEST(gfx.getState().line_width == 1);
}

BOOST_AUTO_TEST_CASE(error_limit)
{
    interpreter_t t;

    std::vector< operation_t > ops(
        PDFDRAW_CONTENT_STREAM_ERROR_LIMIT + 1, op("m", { }));

    ops.push_back(op("q"));

    const auto xs = t.run(ops);

    BOOST_TEST(t.log.count("giving up") == 1U);
    BOOST_TEST(xs.empty());
}

BOOST_AUTO_TEST_CASE(unknown_operators_do_not_count_as_errors)
{
    interpreter_t t;

    std::vector< operation_t > ops(
        PDFDRAW_CONTENT_STREAM_ERROR_LIMIT + 100, op("vendorOp"));

    ops.push_back(op("re", { 0., 0., 10., 10. }));
    ops.push_back(op("f"));

    const auto xs = t.run(ops);

    BOOST_TEST(t.log.count("giving up") == 0U);
    BOOST_TEST(t.log.count("Unknown operator 'vendorOp'") == 1U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 1U);
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(graphics_state)

BOOST_AUTO_TEST_CASE(save_and_restore)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = gfx.display({
        op("rg", { 1., 0., 0. }),
        op("q"), op("rg", { 0., 1., 0. }), op("w", { 4. }), op("Q")
    });

    BOOST_TEST(gfx.getState().fill == (colour_t{ 255, 0, 0 }));
    BOOST_TEST(gfx.getState().line_width == 1);

    BOOST_TEST_REQUIRE(xs.size() == 2U);
    BOOST_TEST((xs[0].op == draw_op_t::PushState));
    BOOST_TEST((xs[1].op == draw_op_t::PopState));
}

BOOST_AUTO_TEST_CASE(restore_without_save)
{
    interpreter_t t;

    auto gfx = t.make();
    const auto xs = gfx.display({ op("w", { 5. }), op("Q") });

    BOOST_TEST(count_ops(xs, draw_op_t::PopState) == 0U);
    BOOST_TEST(gfx.getState().line_width == 1);
    BOOST_TEST(t.log.count("Restore without a matching save") == 1U);
}

BOOST_AUTO_TEST_CASE(unmatched_saves_are_closed)
{
    interpreter_t t;

    auto gfx = t.make();
    const auto xs = gfx.display({ op("q"), op("q"), op("w", { 3. }) });

    BOOST_TEST(count_ops(xs, draw_op_t::PushState) == 2U);
    BOOST_TEST(count_ops(xs, draw_op_t::PopState) == 2U);
    BOOST_TEST(gfx.getSaveDepth() == 0U);
    BOOST_TEST(gfx.getState().line_width == 1);
}

BOOST_AUTO_TEST_CASE(concat_flips_the_y_axis)
{
    interpreter_t t;

    const auto xs = t.run({ op("cm", { 1., 2., 3., 4., 5., 6. }) });

    BOOST_TEST_REQUIRE(xs.size() == 1U);
    BOOST_TEST((xs[0].op == draw_op_t::ConcatTransform));

    const std::vector< double > expected{ 1, -2, -3, 4, 5, -6 };

    for (size_t i = 0; i < expected.size(); ++i)
        BOOST_TEST(xs[0].num(i) == expected[i]);
}

BOOST_AUTO_TEST_CASE(line_parameters)
{
    interpreter_t t;

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("J", { 1 }), op("j", { 2 }), op("M", { 4. }),
        op("d", { array_obj({ 3., 1. }), 2. }),
        op("J", { 7 }), op("j", { -1 }),
        op("d", { array_obj({ name_obj("x") }), 0. }),
        op("w", { 0.25 })
    }));

    const auto &state = gfx.getState();

    BOOST_TEST((state.line_cap == line_cap_t::round));
    BOOST_TEST((state.line_join == line_join_t::bevel));
    BOOST_TEST_REQUIRE(bool(state.miter_limit));
    BOOST_TEST(*state.miter_limit == 4);
    BOOST_TEST(state.dash == (std::vector< double >{ 3, 1 }));
    BOOST_TEST(state.dash_phase == 2);
    BOOST_TEST(state.line_width == 1);

    BOOST_TEST(t.log.count("Bad line cap 7") == 1U);
    BOOST_TEST(t.log.count("Bad line join -1") == 1U);
    BOOST_TEST(t.log.count("Bad dash array") == 1U);
}

BOOST_AUTO_TEST_CASE(ext_gstate)
{
    interpreter_t t;

    t.res->gstates["GS0"] = dict_t{
        { "Type", name_obj("ExtGState") },
        { "LW",   obj_t(3.) },
        { "LC",   obj_t(1) },
        { "LJ",   obj_t(2) },
        { "ML",   obj_t(4) },
        { "D",    array_obj({ array_obj({ 2., 1. }), obj_t(0) }) },
        { "CA",   obj_t(0.5) },
        { "ca",   obj_t(0.25) },
        { "SA",   obj_t(true) },
        { "OP",   obj_t(true) },
        { "OPM",  obj_t(1) },
        { "BM",   array_obj({ name_obj("Multiply"), name_obj("Normal") }) },
        { "Font", array_obj({ }) }
    };

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("gs", { name_obj("GS0") }), op("gs", { name_obj("GS0") })
    }));

    const auto &state = gfx.getState();

    BOOST_TEST(state.line_width == 3);
    BOOST_TEST((state.line_cap == line_cap_t::round));
    BOOST_TEST((state.line_join == line_join_t::bevel));
    BOOST_TEST(*state.miter_limit == 4);
    BOOST_TEST(state.dash == (std::vector< double >{ 2, 1 }));
    BOOST_TEST(state.stroke_alpha == 0.5);
    BOOST_TEST(state.fill_alpha == 0.25);
    BOOST_TEST(state.stroke_adjust);
    BOOST_TEST(state.overprint);
    BOOST_TEST(state.overprint_ns);
    BOOST_TEST(state.overprint_mode == 1);
    BOOST_TEST(state.blend_mode == "Multiply");

    BOOST_TEST(gfx.getReported().seen("gs-key:Font"));
    BOOST_TEST(t.log.count("ExtGState key 'Font'") == 1U);
    BOOST_TEST(t.log.count(errSyntaxError) == 0U);

    // the stored colour is left opaque
    BOOST_TEST(state.fill == (colour_t{ 0, 0, 0, 255 }));
    BOOST_TEST(state.fillColorWithAlpha() == (colour_t{ 0, 0, 0, 64 }));
}

BOOST_AUTO_TEST_CASE(ext_gstate_nonstroking_overprint)
{
    interpreter_t t;

    t.res->gstates["GS0"] = dict_t{
        { "OP", obj_t(true) }, { "op", obj_t(false) }
    };

    auto gfx = t.make();
    static_cast< void >(gfx.display({ op("gs", { name_obj("GS0") }) }));

    BOOST_TEST(gfx.getState().overprint);
    BOOST_TEST(!gfx.getState().overprint_ns);
}

BOOST_AUTO_TEST_CASE(ext_gstate_errors)
{
    interpreter_t t;

    t.res->gstates["GS0"] = dict_t{
        { "LW", name_obj("thick") }, { "Type", name_obj("Font") }
    };

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("gs", { name_obj("GS0") }),
        op("gs", { name_obj("GS9") }), op("gs", { name_obj("GS9") })
    }));

    BOOST_TEST(gfx.getState().line_width == 1);
    BOOST_TEST(t.log.count("Bad value for ExtGState key 'LW'") == 1U);
    BOOST_TEST(t.log.count("Bad value for ExtGState key 'Type'") == 1U);
    BOOST_TEST(t.log.count("ExtGState 'GS9' is unknown") == 1U);
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(colour)

static const std::vector< std::tuple< std::string, std::vector< double >, bool, int, int, int > >
colour_dataset = {
    // operator, operands, stroke, r, g, b
    {   "g", {          0.5 }, false, 128, 128, 128 },
    {   "G", {            1 },  true, 255, 255, 255 },
    {  "rg", {      1, 0, 0 }, false, 255,   0,   0 },
    {  "RG", {      0, 0, 1 },  true,   0,   0, 255 },
    {   "k", {   0, 0, 0, 1 }, false,   0,   0,   0 },
    {   "K", {   0, 0, 0, 0 },  true, 255, 255, 255 },
    {  "sc", {          0.5 }, false, 128, 128, 128 },
    { "scn", {      0, 1, 0 }, false,   0, 255,   0 },
    {  "SC", {      1, 1, 1 },  true, 255, 255, 255 },
    { "SCN", {   0, 1, 1, 0 },  true, 255,   0,   0 },
};

BOOST_DATA_TEST_CASE(
    colour_operators, data::make(colour_dataset), name, operands, stroke, r, g, b)
{
    interpreter_t t;

    std::vector< obj_t > args;

    for (auto x : operands)
        args.emplace_back(x);

    auto gfx = t.make();
    static_cast< void >(gfx.display({ op(name.c_str(), args) }));

    const auto &state = gfx.getState();
    const auto &colour = stroke ? state.stroke : state.fill;

    BOOST_TEST(colour == (colour_t{
        (unsigned char)r, (unsigned char)g, (unsigned char)b }));

    BOOST_TEST(t.log.xs.empty());
}

BOOST_AUTO_TEST_CASE(colour_space_resets_the_colour)
{
    interpreter_t t;

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("rg", { 1., 0., 0. }), op("RG", { 1., 0., 0. }),
        op("cs", { name_obj("DeviceRGB") }), op("CS", { name_obj("CMYK") })
    }));

    const auto &state = gfx.getState();

    BOOST_TEST(state.fill == (colour_t{ 0, 0, 0 }));
    BOOST_TEST((state.fill_space == paint_space_t::rgb));
    BOOST_TEST(state.stroke == (colour_t{ 0, 0, 0 }));
    BOOST_TEST((state.stroke_space == paint_space_t::cmyk));
}

BOOST_AUTO_TEST_CASE(unsupported_colours)
{
    interpreter_t t;

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("rg", { 1., 0., 0. }),
        op("cs", { name_obj("Pattern") }), op("cs", { name_obj("Pattern") }),
        op("scn", { name_obj("P0") }), op("scn", { 0.5, name_obj("P1") }),
        op("sc", { 0.5, 0.5 })
    }));

    BOOST_TEST(gfx.getState().fill == (colour_t{ 255, 0, 0 }));

    BOOST_TEST(t.log.count("Colour space 'Pattern'") == 1U);
    BOOST_TEST(t.log.count("Pattern colours") == 1U);
    BOOST_TEST(t.log.count("Wrong number of colour components (2)") == 1U);
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(path)

BOOST_AUTO_TEST_CASE(stroke)
{
    interpreter_t t;

    const auto xs = t.run({
        op("RG", { 1., 0., 0. }), op("w", { 2. }),
        op("m", { 0., 0. }), op("l", { 10., 20. }), op("S")
    });

    BOOST_TEST_REQUIRE(xs.size() == 6U);

    BOOST_TEST((xs[0].op == draw_op_t::SetPen));
    BOOST_TEST((xs[2].op == draw_op_t::CreatePath));
    BOOST_TEST((xs[4].op == draw_op_t::LineTo));
    BOOST_TEST((xs[5].op == draw_op_t::DrawPath));

    BOOST_TEST(xs[4].num(1) == -20);

    const auto &pen = xs[0].arg< pen_t >(0);

    BOOST_TEST(pen.colour == (colour_t{ 255, 0, 0 }));
    BOOST_TEST(pen.width == 2);
    BOOST_TEST(xs[1].arg< brush_t >(0).transparent);
}

BOOST_AUTO_TEST_CASE(path_ends_with_its_painting_operator)
{
    interpreter_t t;

    const auto xs = t.run({
        op("re", { 0., 0., 10., 10. }), op("f"), op("S")
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 1U);
    BOOST_TEST(count_ops(xs, draw_op_t::AddRectangle) == 1U);
}

BOOST_AUTO_TEST_CASE(clip_is_recorded)
{
    interpreter_t t;

    auto gfx = t.make();

    static_cast< void >(gfx.display({
        op("q"),
        op("re", { 0., 0., 10., 10. }), op("W*"), op("n"),
        op("re", { 0., 0., 20., 20. }), op("f")
    }));

    // closed at the end of the stream
    BOOST_TEST(gfx.getState().clips.empty());

    auto other = t.make();

    static_cast< void >(other.display({
        op("re", { 0., 0., 10., 10. }), op("W"), op("n"),
        op("re", { 0., 0., 20., 20. }), op("f")
    }));

    const auto &clips = other.getState().clips;

    BOOST_TEST_REQUIRE(clips.size() == 1U);
    BOOST_TEST((clips[0].rule == fill_rule_t::winding));
    BOOST_TEST(clips[0].path.size() == 1U);
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(text)

BOOST_AUTO_TEST_CASE(show_space_text)
{
    interpreter_t t;

    const auto xs = only(t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("TJ", { array_obj({ std::string("Hello"), -120., std::string("World") }) }),
        op("ET")
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 2U);

    BOOST_TEST(xs[0].arg< std::string >(0) == "Hello");
    BOOST_TEST(xs[0].num(1) == 0);
    BOOST_TEST(xs[0].num(2) == -9.6, boost::test_tools::tolerance(1e-9));

    BOOST_TEST(xs[1].arg< std::string >(0) == "World");
    BOOST_TEST(xs[1].num(1) == 30., boost::test_tools::tolerance(1e-9));

    const auto &font = xs[0].kwargs.at("font");

    BOOST_TEST(std::get< font_t >(font).face == "Arial");
    BOOST_TEST(std::get< font_t >(font).size == 12);
}

BOOST_AUTO_TEST_CASE(show_space_text_bad_element)
{
    interpreter_t t;

    const auto xs = t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("TJ", { array_obj({ name_obj("x"), std::string("a") }) })
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawText) == 1U);
    BOOST_TEST(t.log.count("must be number or string") == 1U);
}

BOOST_AUTO_TEST_CASE(set_font_precedes_the_text)
{
    interpreter_t t;

    const auto xs = t.run({
        op("BT"), op("rg", { 1., 0., 0. }), op("Tf", { name_obj("F1"), 10. }),
        op("Tj", { std::string("a") })
    });

    BOOST_TEST_REQUIRE(xs.size() == 2U);
    BOOST_TEST((xs[0].op == draw_op_t::SetFont));
    BOOST_TEST(xs[0].arg< colour_t >(1) == (colour_t{ 255, 0, 0 }));
    BOOST_TEST((xs[1].op == draw_op_t::DrawText));
    BOOST_TEST(std::get< colour_t >(xs[1].kwargs.at("colour")) == (colour_t{ 255, 0, 0 }));
}

BOOST_AUTO_TEST_CASE(word_spacing_splits_runs)
{
    interpreter_t t;

    const auto xs = only(t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }), op("Tw", { 2. }),
        op("Tj", { std::string("a b") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 2U);

    BOOST_TEST(xs[0].arg< std::string >(0) == "a ");
    BOOST_TEST(xs[1].arg< std::string >(0) == "b ");
    BOOST_TEST(xs[1].num(1) == 14., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(word_spacing_keeps_every_space)
{
    interpreter_t t;

    const auto xs = only(t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }), op("Tw", { 1. }),
        op("Tj", { std::string("a   b") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 4U);

    BOOST_TEST(xs[0].arg< std::string >(0) == "a ");
    BOOST_TEST(xs[1].arg< std::string >(0) == " ");
    BOOST_TEST(xs[2].arg< std::string >(0) == " ");
    BOOST_TEST(xs[3].arg< std::string >(0) == "b ");

    // a run of n bytes is 6n wide, plus one for the word spacing
    BOOST_TEST(xs[0].num(1) == 0.,  boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[1].num(1) == 13., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[2].num(1) == 20., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[3].num(1) == 27., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(word_spacing_single_space)
{
    interpreter_t t;

    const auto xs = only(t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }), op("Tw", { 1. }),
        op("Tj", { std::string(" ") }), op("Tj", { std::string("  c") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 5U);

    BOOST_TEST(xs[0].arg< std::string >(0) == " ");
    BOOST_TEST(xs[1].arg< std::string >(0) == " ");
    BOOST_TEST(xs[1].num(1) == 7., boost::test_tools::tolerance(1e-9));

    // leading spaces are runs of their own
    BOOST_TEST(xs[2].num(1) == 14., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[3].num(1) == 21., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[4].arg< std::string >(0) == "c ");
    BOOST_TEST(xs[4].num(1) == 28., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(spacing_and_scaling_do_not_move_text)
{
    interpreter_t t;

    const auto xs = only(t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("Tc", { 5. }), op("Tz", { 50. }),
        op("Tj", { std::string("Hello") }), op("Tj", { std::string("World") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 2U);
    BOOST_TEST(xs[1].num(1) == 30., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(precise_widths)
{
    interpreter_t t;
    precise_metrics_t metrics;

    t.res->fonts["F2"] = "MyriadPro";

    Gfx gfx(t.params, metrics, t.cache, t.fonts, t.res);

    const auto xs = only(gfx.display({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("Tj", { std::string("ab") }), op("Tj", { std::string("cd") }),
        op("Tf", { name_obj("F2"), 12. }), op("Td", { 0., 0. }),
        op("Tj", { std::string("ab") }), op("Tj", { std::string("cd") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 4U);

    // Helvetica from the precise widths, the unknown font from its extent
    BOOST_TEST(xs[1].num(1) == 6., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[3].num(1) == 12., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_CASE(text_positioning)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = only(gfx.display({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("TL", { 14. }), op("Td", { 10., 100. }), op("T*"),
        op("Tj", { std::string("a") }),
        op("TD", { 5., -20. }),
        op("Tj", { std::string("b") }),
        op("Tm", { 1., 0., 0., 1., 50., 50. }), op("Ts", { 3. }),
        op("Tj", { std::string("c") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 3U);

    BOOST_TEST(xs[0].num(1) == 10);
    BOOST_TEST(xs[0].num(2) == -95.6, boost::test_tools::tolerance(1e-9));

    BOOST_TEST(xs[1].num(1) == 15);
    BOOST_TEST(xs[1].num(2) == -75.6, boost::test_tools::tolerance(1e-9));

    BOOST_TEST(xs[2].num(1) == 50);
    BOOST_TEST(xs[2].num(2) == -62.6, boost::test_tools::tolerance(1e-9));

    BOOST_TEST(gfx.getState().text.leading == 20);
    BOOST_TEST(gfx.inTextObject());
}

BOOST_AUTO_TEST_CASE(next_line_show_operators)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = only(gfx.display({
        op("BT"), op("Tf", { name_obj("F1"), 10. }), op("TL", { 10. }),
        op("'", { std::string("a") }),
        op("\"", { 3., 1., std::string("b") })
    }), draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(xs.size() == 2U);

    // y: 10 - (10 - 2)
    BOOST_TEST(xs[0].num(2) == 2., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[1].num(2) == 12., boost::test_tools::tolerance(1e-9));
    BOOST_TEST(xs[1].arg< std::string >(0) == "b ");

    BOOST_TEST(gfx.getState().text.word_spacing == 3);
    BOOST_TEST(gfx.getState().text.char_spacing == 1);
}

BOOST_AUTO_TEST_CASE(text_outside_of_a_text_object)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = gfx.display({
        op("Tf", { name_obj("F1"), 12. }),
        op("Tj", { std::string("a") }), op("Tj", { std::string("b") }),
        op("Td", { 1., 1. }),
        op("BT"), op("ET"), op("Tj", { std::string("c") })
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawText) == 0U);
    BOOST_TEST(gfx.getReported().seen("text:Tj"));
    BOOST_TEST(gfx.getReported().seen("text:Td"));
    BOOST_TEST(t.log.count("outside of a text object") == 2U);
    BOOST_TEST(!gfx.inTextObject());

    // Tf is a text state operator
    BOOST_TEST(gfx.getState().text.base_font == "Helvetica");
}

BOOST_AUTO_TEST_CASE(unknown_font_tag)
{
    interpreter_t t;

    auto gfx = t.make();

    const auto xs = only(gfx.display({
        op("BT"), op("Tf", { name_obj("F9"), 12. }),
        op("Tj", { std::string("a") }),
        op("Tf", { name_obj("F9"), 12. })
    }), draw_op_t::DrawText);

    BOOST_TEST(xs.size() == 1U);
    BOOST_TEST(gfx.getState().text.base_font == "F9");
    BOOST_TEST(t.log.count("Unknown font tag 'F9'") == 1U);
    BOOST_TEST(t.fonts.missing().count("F9") == 1U);
}

BOOST_AUTO_TEST_CASE(font_scales)
{
    interpreter_t t;

    t.params.setFontScaleSize(2);
    t.params.setFontScaleMetrics(0.5);

    const auto xs = t.run({
        op("BT"), op("Tf", { name_obj("F1"), 12. }),
        op("Tj", { std::string("ab") }), op("Tj", { std::string("cd") })
    });

    const auto texts = only(xs, draw_op_t::DrawText);

    BOOST_TEST_REQUIRE(texts.size() == 2U);
    BOOST_TEST(std::get< font_t >(texts[0].kwargs.at("font")).size == 24);

    // measured with a 6 point font
    BOOST_TEST(texts[1].num(1) == 6., boost::test_tools::tolerance(1e-9));
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(xobjects)

BOOST_AUTO_TEST_CASE(image_transform_is_folded)
{
    interpreter_t t;

    t.res->xobjects["Im0"] = rgb_image(2, 1, std::string("\xFF\0\0\0\xFF\0", 6));

    const auto xs = t.run({
        op("q"), op("cm", { 20., 0., 0., 10., 5., 5. }),
        op("Do", { name_obj("Im0") }), op("Q")
    });

    BOOST_TEST_REQUIRE(xs.size() == 4U);

    const auto &ct = xs[1];
    const auto &bm = xs[2];

    BOOST_TEST((ct.op == draw_op_t::ConcatTransform));
    BOOST_TEST(ct.num(0) == 1);
    BOOST_TEST(ct.num(3) == 1);
    BOOST_TEST(ct.num(4) == 5);
    BOOST_TEST(ct.num(5) == -5);

    BOOST_TEST((bm.op == draw_op_t::DrawBitmap));
    BOOST_TEST(bm.num(1) == 0);
    BOOST_TEST(bm.num(2) == -10);
    BOOST_TEST(bm.num(3) == 20);
    BOOST_TEST(bm.num(4) == 10);

    const auto &bmp = bm.arg< bitmap_ptr >(0);

    BOOST_TEST_REQUIRE(bool(bmp));
    BOOST_TEST(bmp->pixel(1, 0) == (colour_t{ 0, 255, 0 }));
}

BOOST_AUTO_TEST_CASE(jpeg_image)
{
    interpreter_t t;

    // uniform 8x8 gray 200
    static const char jpeg[] =
        "\xFF\xD8\xFF\xDB\x00\x43\x00\x01\x01\x01\x01\x01\x01\x01\x01\x01"
        "\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01"
        "\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01"
        "\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01\x01"
        "\x01\x01\x01\x01\x01\x01\x01\xFF\xC0\x00\x0B\x08\x00\x08\x00\x08"
        "\x01\x01\x11\x00\xFF\xC4\x00\x1F\x00\x00\x01\x05\x01\x01\x01\x01"
        "\x01\x01\x00\x00\x00\x00\x00\x00\x00\x00\x01\x02\x03\x04\x05\x06"
        "\x07\x08\x09\x0A\x0B\xFF\xC4\x00\x14\x10\x01\x00\x00\x00\x00\x00"
        "\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\x00\xFF\xDA\x00\x08\x01"
        "\x01\x00\x00\x3F\x00\xFE\x90\x1F\xFF\xD9";

    auto img = std::make_shared< image_t >(
        *rgb_image(8, 8, std::string(jpeg, sizeof jpeg - 1)));

    img->filters.names = { "DCTDecode" };

    t.res->xobjects["Im0"] = image_ptr(img);

    const auto xs = only(t.run({
        op("q"), op("cm", { 16., 0., 0., 16., 0., 0. }),
        op("Do", { name_obj("Im0") }), op("Q")
    }), draw_op_t::DrawBitmap);

    BOOST_TEST_REQUIRE(xs.size() == 1U);

    const auto &bmp = xs[0].arg< bitmap_ptr >(0);

    BOOST_TEST_REQUIRE(bool(bmp));
    BOOST_TEST(bmp->width == 8);
    BOOST_TEST(bmp->height == 8);

    const auto c = bmp->pixel(3, 5);

    BOOST_TEST(std::abs(int(c.r) - 200) <= 2);
    BOOST_TEST(c.r == c.g);
    BOOST_TEST(c.r == c.b);

    BOOST_TEST(xs[0].num(3) == 16);
    BOOST_TEST(xs[0].num(4) == 16);
    BOOST_TEST(t.log.xs.empty());
}

BOOST_AUTO_TEST_CASE(unsupported_image_is_skipped)
{
    interpreter_t t;

    auto img = std::make_shared< image_t >(*rgb_image(1, 1, std::string(4, '\0')));

    img->colour_space.kind = colour_space_kind_t::unsupported;
    img->colour_space.name = "DeviceCMYK";

    t.res->xobjects["Im1"] = image_ptr(img);

    const auto xs = t.run({
        op("Do", { name_obj("Im1") }), op("Do", { name_obj("Im1") }),
        op("re", { 0., 0., 1., 1. }), op("f")
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawBitmap) == 0U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 1U);

    BOOST_TEST(t.log.count(errUnimplemented) == 1U);
    BOOST_TEST(t.log.count("DeviceCMYK") == 1U);
}

BOOST_AUTO_TEST_CASE(undecodable_image_is_skipped)
{
    interpreter_t t;

    t.res->xobjects["Im0"] = rgb_image(2, 2, std::string(3, '\0'));

    const auto xs = t.run({
        op("Do", { name_obj("Im0") }), op("Do", { name_obj("Im0") }),
        op("re", { 0., 0., 1., 1. }), op("f")
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawBitmap) == 0U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 1U);
    BOOST_TEST(t.log.count(errDecode) == 2U);
}

BOOST_AUTO_TEST_CASE(malformed_colour_key_fails_one_image)
{
    interpreter_t t;

    auto img = std::make_shared< image_t >(*rgb_image(1, 1, std::string(3, '\0')));
    img->colour_key = { 0, 1, 2 };

    t.res->xobjects["Im0"] = image_ptr(img);
    t.res->xobjects["Im1"] = rgb_image(1, 1, std::string(3, '\0'));

    const auto xs = t.run({
        op("Do", { name_obj("Im0") }), op("Do", { name_obj("Im1") })
    });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawBitmap) == 1U);
    BOOST_TEST(t.log.count(errInternal) == 1U);
}

BOOST_AUTO_TEST_CASE(inline_image)
{
    interpreter_t t;

    const dict_t dict{
        { "W",   obj_t(1) }, { "H", obj_t(1) }, { "BPC", obj_t(8) },
        { "CS",  name_obj("RGB") }
    };

    const auto xs = t.run({
        op("BI", { obj_t(dict), std::string("\xFF\0\0", 3) }), op("ID"), op("EI")
    });

    BOOST_TEST_REQUIRE(xs.size() == 1U);
    BOOST_TEST((xs[0].op == draw_op_t::DrawBitmap));
    BOOST_TEST(xs[0].arg< bitmap_ptr >(0)->pixel(0, 0) == (colour_t{ 255, 0, 0 }));
}

BOOST_AUTO_TEST_CASE(unknown_xobject)
{
    interpreter_t t;

    const auto xs = t.run({
        op("Do", { name_obj("Nope") }), op("Do", { name_obj("Nope") })
    });

    BOOST_TEST(xs.empty());
    BOOST_TEST(t.log.count("XObject 'Nope' is unknown") == 1U);
}

BOOST_AUTO_TEST_CASE(form_expands_once)
{
    interpreter_t t;

    t.res->xobjects["Fm0"] = make_form({ op("re", { 0., 0., 10., 10. }), op("f") });

    const auto xs = t.run({
        op("Do", { name_obj("Fm0") }), op("Do", { name_obj("Fm0") })
    });

    BOOST_TEST(t.cache.expansions() == 1U);

    BOOST_TEST(count_ops(xs, draw_op_t::PushState) == 2U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 2U);
    BOOST_TEST(count_ops(xs, draw_op_t::PopState) == 2U);

    // the next page in the same scope hits the cache too
    static_cast< void >(t.run({ op("Do", { name_obj("Fm0") }) }));
    BOOST_TEST(t.cache.expansions() == 1U);
}

BOOST_AUTO_TEST_CASE(form_matrix)
{
    interpreter_t t;

    t.res->xobjects["Fm0"] = make_form(
        { op("re", { 0., 0., 10., 10. }), op("f") },
        matrix_t{ 2, 0, 0, 2, 10, 20 });

    const auto xs = t.run({ op("Do", { name_obj("Fm0") }) });

    BOOST_TEST_REQUIRE(xs.size() >= 2U);
    BOOST_TEST((xs[0].op == draw_op_t::PushState));
    BOOST_TEST((xs[1].op == draw_op_t::ConcatTransform));
    BOOST_TEST(xs[1].num(0) == 2);
    BOOST_TEST(xs[1].num(4) == 10);
    BOOST_TEST(xs[1].num(5) == -20);
    BOOST_TEST((xs.back().op == draw_op_t::PopState));
}

BOOST_AUTO_TEST_CASE(form_resources)
{
    interpreter_t t;

    auto inner = std::make_shared< Resources >();

    inner->scope = "form Fm0";
    inner->xobjects["Im0"] = rgb_image(1, 1, std::string(3, '\0'));

    auto form = std::make_shared< form_t >(*make_form({
        op("BT"), op("Tf", { name_obj("F1"), 10. }), op("Tj", { std::string("a") }),
        op("ET"), op("Do", { name_obj("Im0") })
    }));

    form->resources = inner;
    t.res->xobjects["Fm0"] = form_ptr(form);

    const auto xs = t.run({ op("Do", { name_obj("Fm0") }), op("Do", { name_obj("Im0") }) });

    // the font comes from the page, the image from the form only
    BOOST_TEST(count_ops(xs, draw_op_t::DrawText) == 1U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawBitmap) == 1U);
    BOOST_TEST(t.log.count("XObject 'Im0' is unknown") == 1U);
}

BOOST_AUTO_TEST_CASE(forms_in_distinct_scopes)
{
    interpreter_t t;

    t.res->xobjects["Fm0"] = make_form({ op("re", { 0., 0., 1., 1. }), op("f") });
    static_cast< void >(t.run({ op("Do", { name_obj("Fm0") }) }));

    auto other = std::make_shared< Resources >();

    other->scope = "page 2";
    other->xobjects["Fm0"] = make_form({ op("q"), op("Q") });

    Gfx gfx(t.params, t.metrics, t.cache, t.fonts, other);
    const auto xs = gfx.display({ op("Do", { name_obj("Fm0") }) });

    BOOST_TEST(t.cache.expansions() == 2U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 0U);
    BOOST_TEST(count_ops(xs, draw_op_t::PushState) == 2U);
}

BOOST_AUTO_TEST_CASE(self_referencing_form)
{
    interpreter_t t;

    t.res->xobjects["Fm0"] = make_form({
        op("re", { 0., 0., 1., 1. }), op("f"), op("Do", { name_obj("Fm0") })
    });

    const auto xs = t.run({ op("Do", { name_obj("Fm0") }) });

    BOOST_TEST(t.cache.expansions() == 1U);
    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 1U);
    BOOST_TEST(t.log.count("Loop in form 'Fm0'") == 1U);
}

BOOST_AUTO_TEST_CASE(form_depth_limit)
{
    interpreter_t t;

    t.params.setFormDepthLimit(1);

    t.res->xobjects["Fm0"] = make_form({ op("Do", { name_obj("Fm1") }) });
    t.res->xobjects["Fm1"] = make_form({ op("re", { 0., 0., 1., 1. }), op("f") });

    const auto xs = t.run({ op("Do", { name_obj("Fm0") }) });

    BOOST_TEST(count_ops(xs, draw_op_t::DrawPath) == 0U);
    BOOST_TEST(t.log.count("nested too deeply") == 1U);
}

BOOST_AUTO_TEST_CASE(form_state_does_not_leak)
{
    interpreter_t t;

    t.res->xobjects["Fm0"] = make_form({ op("w", { 9. }), op("q"), op("rg", { 1., 0., 0. }) });

    auto gfx = t.make();
    const auto xs = gfx.display({ op("Do", { name_obj("Fm0") }) });

    BOOST_TEST(gfx.getState().line_width == 1);
    BOOST_TEST(gfx.getState().fill == (colour_t{ 0, 0, 0 }));
    BOOST_TEST(count_ops(xs, draw_op_t::PushState) == count_ops(xs, draw_op_t::PopState));
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(printing)

BOOST_AUTO_TEST_CASE(commands)
{
    interpreter_t t;

    const auto xs = t.run({
        op("cm", { 1., 2., 3., 4., 5., 6. }),
        op("BT"), op("Tf", { name_obj("F1"), 12. }), op("Tj", { std::string("a") })
    });

    BOOST_TEST_REQUIRE(xs.size() == 3U);

    std::stringstream ss;
    ss << xs[0];

    BOOST_TEST(ss.str() == "ConcatTransform 1 -2 -3 4 5 -6");

    ss.str("");
    ss << xs[2];

    BOOST_TEST(ss.str() ==
               "DrawText (a) 0 -9.6 colour=rgba(0,0,0,255) font=font(Arial swiss 12)");

    ss.str("");
    ss << xs;

    const auto s = ss.str();
    BOOST_TEST(std::count(s.begin(), s.end(), '\n') == 3);
}

BOOST_AUTO_TEST_SUITE_END()
