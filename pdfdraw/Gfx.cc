// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstring>
#include <iostream>

#include <pdfdraw/Error.hh>
#include <pdfdraw/Gfx.hh>
#include <pdfdraw/Image.hh>
#include <pdfdraw/TransformFold.hh>

#include <range/v3/algorithm/find.hpp>
using namespace ranges;

namespace pdfdraw {

//------------------------------------------------------------------------
// Operator table
//------------------------------------------------------------------------

/* static */ const Gfx::Operator Gfx::opTab[] = {
    { "\"", 3, { typeCheckNum, typeCheckNum, typeCheckString }, op_t::moveSetShowText },
    { "'", 1, { typeCheckString }, op_t::moveShowText },
    { "B", 0, { typeCheckNone }, op_t::fillStroke },
    { "B*", 0, { typeCheckNone }, op_t::eoFillStroke },
    { "BDC", 2, { typeCheckName, typeCheckProps }, op_t::beginMarkedContent },
    { "BI", 2, { typeCheckDict, typeCheckString }, op_t::beginImage },
    { "BMC", 1, { typeCheckName }, op_t::beginMarkedContent },
    { "BT", 0, { typeCheckNone }, op_t::beginText },
    { "BX", 0, { typeCheckNone }, op_t::beginIgnoreUndef },
    { "CS", 1, { typeCheckName }, op_t::setStrokeColorSpace },
    { "DP", 2, { typeCheckName, typeCheckProps }, op_t::markPoint },
    { "Do", 1, { typeCheckName }, op_t::xObject },
    { "EI", 0, { typeCheckNone }, op_t::endImage },
    { "EMC", 0, { typeCheckNone }, op_t::endMarkedContent },
    { "ET", 0, { typeCheckNone }, op_t::endText },
    { "EX", 0, { typeCheckNone }, op_t::endIgnoreUndef },
    { "F", 0, { typeCheckNone }, op_t::fill },
    { "G", 1, { typeCheckNum }, op_t::setStrokeGray },
    { "ID", 0, { typeCheckNone }, op_t::imageData },
    { "J", 1, { typeCheckInt }, op_t::setLineCap },
    { "K",
      4,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::setStrokeCMYKColor },
    { "M", 1, { typeCheckNum }, op_t::setMiterLimit },
    { "MP", 1, { typeCheckName }, op_t::markPoint },
    { "Q", 0, { typeCheckNone }, op_t::restore },
    { "RG", 3, { typeCheckNum, typeCheckNum, typeCheckNum }, op_t::setStrokeRGBColor },
    { "S", 0, { typeCheckNone }, op_t::stroke },
    { "SC",
      -4,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::setStrokeColor },
    { "SCN",
      -33,
      { typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN },
      op_t::setStrokeColorN },
    { "T*", 0, { typeCheckNone }, op_t::textNextLine },
    { "TD", 2, { typeCheckNum, typeCheckNum }, op_t::textMoveSet },
    { "TJ", 1, { typeCheckArray }, op_t::showSpaceText },
    { "TL", 1, { typeCheckNum }, op_t::setTextLeading },
    { "Tc", 1, { typeCheckNum }, op_t::setCharSpacing },
    { "Td", 2, { typeCheckNum, typeCheckNum }, op_t::textMove },
    { "Tf", 2, { typeCheckName, typeCheckNum }, op_t::setFont },
    { "Tj", 1, { typeCheckString }, op_t::showText },
    { "Tm",
      6,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::setTextMatrix },
    { "Tr", 1, { typeCheckInt }, op_t::setTextRender },
    { "Ts", 1, { typeCheckNum }, op_t::setTextRise },
    { "Tw", 1, { typeCheckNum }, op_t::setWordSpacing },
    { "Tz", 1, { typeCheckNum }, op_t::setHorizScaling },
    { "W", 0, { typeCheckNone }, op_t::clip },
    { "W*", 0, { typeCheckNone }, op_t::eoClip },
    { "b", 0, { typeCheckNone }, op_t::closeFillStroke },
    { "b*", 0, { typeCheckNone }, op_t::closeEOFillStroke },
    { "c",
      6,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::curveTo },
    { "cm",
      6,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::concat },
    { "cs", 1, { typeCheckName }, op_t::setFillColorSpace },
    { "d", 2, { typeCheckArray, typeCheckNum }, op_t::setDash },
    { "d0", 2, { typeCheckNum, typeCheckNum }, op_t::setCharWidth },
    { "d1",
      6,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::setCacheDevice },
    { "f", 0, { typeCheckNone }, op_t::fill },
    { "f*", 0, { typeCheckNone }, op_t::eoFill },
    { "g", 1, { typeCheckNum }, op_t::setFillGray },
    { "gs", 1, { typeCheckName }, op_t::setExtGState },
    { "h", 0, { typeCheckNone }, op_t::closePath },
    { "i", 1, { typeCheckNum }, op_t::setFlat },
    { "j", 1, { typeCheckInt }, op_t::setLineJoin },
    { "k",
      4,
      { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum },
      op_t::setFillCMYKColor },
    { "l", 2, { typeCheckNum, typeCheckNum }, op_t::lineTo },
    { "m", 2, { typeCheckNum, typeCheckNum }, op_t::moveTo },
    { "n", 0, { typeCheckNone }, op_t::endPath },
    { "q", 0, { typeCheckNone }, op_t::save },
    { "re", 4, { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum }, op_t::rectangle },
    { "rg", 3, { typeCheckNum, typeCheckNum, typeCheckNum }, op_t::setFillRGBColor },
    { "ri", 1, { typeCheckName }, op_t::setRenderingIntent },
    { "s", 0, { typeCheckNone }, op_t::closeStroke },
    { "sc", -4, { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum }, op_t::setFillColor },
    { "scn",
      -33,
      { typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN,
        typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN, typeCheckSCN },
      op_t::setFillColorN },
    { "sh", 1, { typeCheckName }, op_t::shFill },
    { "v", 4, { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum }, op_t::curveTo1 },
    { "w", 1, { typeCheckNum }, op_t::setLineWidth },
    { "y", 4, { typeCheckNum, typeCheckNum, typeCheckNum, typeCheckNum }, op_t::curveTo2 },
};

/* static */ const size_t Gfx::numOps = sizeof opTab / sizeof *opTab;

namespace {

std::optional< paint_space_t > make_paint_space(const std::string &name)
{
    if (name == "DeviceGray" || name == "G")
        return paint_space_t::gray;

    if (name == "DeviceRGB" || name == "RGB")
        return paint_space_t::rgb;

    if (name == "DeviceCMYK" || name == "CMYK")
        return paint_space_t::cmyk;

    return { };
}

bool make_dash(const obj_t &arr, std::vector< double > &dash)
{
    if (!arr.is_array())
        return false;

    std::vector< double > xs;

    for (auto &x : arr.as_array()) {
        if (!x.is_num())
            return false;

        xs.push_back(x.as_num());
    }

    dash = std::move(xs);
    return true;
}

template< typename T >
bool assign(const std::optional< T > &from, T &to)
{
    if (from)
        to = *from;

    return bool(from);
}

} // anonymous

//------------------------------------------------------------------------
// Gfx
//------------------------------------------------------------------------

Gfx::Gfx(const GlobalParams &paramsA, const TextMetrics &metricsA,
         FormCache &cacheA, FontResolver &fontsA,
         std::shared_ptr< const Resources > resA, filter_codecs_t codecs)
    : params(paramsA), metrics(metricsA), cache(cacheA), fonts(fontsA),
      once(std::make_shared< ErrorOnce >()), decoder(std::move(codecs))
{
    if (!resA)
        resA = std::make_shared< const Resources >();

    res.push_back(std::move(resA));
}

Gfx::Gfx(const Gfx &parent, std::shared_ptr< const Resources > resA,
         const form_t *form)
    : params(parent.params), metrics(parent.metrics), cache(parent.cache),
      fonts(parent.fonts), once(parent.once), res(parent.res),
      decoder(parent.decoder), initial(parent.state), state(parent.state),
      formStack(parent.formStack)
{
    if (resA)
        res.push_back(std::move(resA));

    formStack.push_back(form);
}

draw_list_t Gfx::display(const std::vector< operation_t > &ops)
{
    out.clear();

    go(ops);

    if (!saves.empty()) {
        error(errSyntaxWarning, -1,
              "{0:d} unmatched save(s) at the end of the content stream",
              saves.size());

        while (!saves.empty())
            opRestore();
    }

    path.clear();
    pendingClip.reset();

    return fold_transforms(std::move(out));
}

void Gfx::go(const std::vector< operation_t > &ops)
{
    int errCount = 0;

    for (pos = 0; pos < long(ops.size()); ++pos) {
        const auto &operation = ops[pos];

        if (params.getPrintCommands())
            printCommand(operation);

        if (!execOp(operation))
            ++errCount;

        // check for too many errors
        if (errCount > PDFDRAW_CONTENT_STREAM_ERROR_LIMIT) {
            error(errSyntaxError, pos,
                  "Too many errors - giving up on this content stream");
            break;
        }
    }

    pos = -1;
}

void Gfx::printCommand(const operation_t &operation) const
{
    std::cout << operation.op;

    for (auto &arg : operation.args)
        std::cout << " " << arg;

    std::cout << std::endl;
}

// Returns true if successful, false on error.
bool Gfx::execOp(const operation_t &operation)
{
    const auto &name = operation.op;

    // find operator
    const Operator *op = findOp(name.c_str());

    if (0 == op) {
        // reported, but not counted against the error limit
        if (0 == ignoreUndef)
            (*once)("op:" + name, errSyntaxError, "Unknown operator '{0:s}'", name);

        return true;
    }

    // type check args
    const obj_t *argPtr = operation.args.data();
    int numArgs = int(operation.args.size());

    if (op->numArgs >= 0) {
        if (numArgs < op->numArgs) {
            error(errSyntaxError, pos,
                  "Too few ({0:d}) args to '{1:s}' operator", numArgs, name);
            return false;
        }

        if (numArgs > op->numArgs) {
            argPtr += numArgs - op->numArgs;
            numArgs = op->numArgs;
        }
    } else {
        if (numArgs > -op->numArgs) {
            error(errSyntaxError, pos,
                  "Too many ({0:d}) args to '{1:s}' operator", numArgs, name);
            return false;
        }
    }

    for (int i = 0; i < numArgs; ++i) {
        if (!checkArg(argPtr[i], op->tchk[i])) {
            error(errSyntaxError, pos,
                  "Arg #{0:d} to '{1:s}' operator is wrong type ({2:s})", i,
                  name, argPtr[i].getTypeName());
            return false;
        }
    }

    // do it
    dispatch(op->op, name, argPtr, numArgs);

    return true;
}

/* static */ const Gfx::Operator *Gfx::findOp(const char *name)
{
    int a, b, m, cmp;

    a = -1;
    b = int(numOps);
    cmp = 0;

    // invariant: opTab[a] < name < opTab[b]
    while (b - a > 1) {
        m = (a + b) / 2;
        cmp = strcmp(opTab[m].name, name);

        if (cmp < 0)
            a = m;
        else if (cmp > 0)
            b = m;
        else
            a = b = m;
    }

    if (cmp != 0)
        return 0;

    return &opTab[a];
}

bool Gfx::checkArg(const obj_t &arg, typeCheckType type) const
{
    switch (type) {
    case typeCheckBool:   return arg.is_bool();
    case typeCheckInt:    return arg.is_int();
    case typeCheckNum:    return arg.is_num();
    case typeCheckString: return arg.is_string();
    case typeCheckName:   return arg.is_name();
    case typeCheckArray:  return arg.is_array();
    case typeCheckDict:   return arg.is_dict();
    case typeCheckProps:  return arg.is_dict() || arg.is_name();
    case typeCheckSCN:    return arg.is_num() || arg.is_name();
    case typeCheckNone:   return false;
    }

    return false;
}

void Gfx::dispatch(op_t op, const std::string &name, const obj_t args[], int numArgs)
{
    auto &text = state.text;

    switch (op) {
        //
        // graphics state operators
        //
    case op_t::save:          opSave(); break;
    case op_t::restore:       opRestore(); break;
    case op_t::concat:        opConcat(args); break;
    case op_t::setDash:       opSetDash(args); break;
    case op_t::setLineJoin:   opSetLineJoin(args); break;
    case op_t::setLineCap:    opSetLineCap(args); break;
    case op_t::setMiterLimit: opSetMiterLimit(args); break;
    case op_t::setLineWidth:  opSetLineWidth(args); break;
    case op_t::setExtGState:  opSetExtGState(args); break;

    case op_t::setRenderingIntent:
    case op_t::setFlat:
        break;

        //
        // color operators
        //
    case op_t::setStrokeGray:
        state.stroke = gray_colour(args[0].as_num());
        state.stroke_space = paint_space_t::gray;
        break;

    case op_t::setFillGray:
        state.fill = gray_colour(args[0].as_num());
        state.fill_space = paint_space_t::gray;
        break;

    case op_t::setStrokeRGBColor:
        state.stroke = rgb_colour(
            args[0].as_num(), args[1].as_num(), args[2].as_num());
        state.stroke_space = paint_space_t::rgb;
        break;

    case op_t::setFillRGBColor:
        state.fill = rgb_colour(
            args[0].as_num(), args[1].as_num(), args[2].as_num());
        state.fill_space = paint_space_t::rgb;
        break;

    case op_t::setStrokeCMYKColor:
        state.stroke = cmyk_colour(
            args[0].as_num(), args[1].as_num(), args[2].as_num(),
            args[3].as_num());
        state.stroke_space = paint_space_t::cmyk;
        break;

    case op_t::setFillCMYKColor:
        state.fill = cmyk_colour(
            args[0].as_num(), args[1].as_num(), args[2].as_num(),
            args[3].as_num());
        state.fill_space = paint_space_t::cmyk;
        break;

    case op_t::setStrokeColorSpace: opSetColorSpace(args, true); break;
    case op_t::setFillColorSpace:   opSetColorSpace(args, false); break;

    case op_t::setStrokeColor:
    case op_t::setStrokeColorN:
        opSetColor(args, numArgs, true);
        break;

    case op_t::setFillColor:
    case op_t::setFillColorN:
        opSetColor(args, numArgs, false);
        break;

        //
        // path segment operators
        //
    case op_t::moveTo:
        path.moveTo(args[0].as_num(), args[1].as_num());
        break;

    case op_t::lineTo:
        path.lineTo(args[0].as_num(), args[1].as_num());
        break;

    case op_t::curveTo:
        path.curveTo(args[0].as_num(), args[1].as_num(), args[2].as_num(),
                     args[3].as_num(), args[4].as_num(), args[5].as_num());
        break;

    case op_t::curveTo1:
        path.curveTo1(args[0].as_num(), args[1].as_num(), args[2].as_num(),
                      args[3].as_num());
        break;

    case op_t::curveTo2:
        path.curveTo2(args[0].as_num(), args[1].as_num(), args[2].as_num(),
                      args[3].as_num());
        break;

    case op_t::rectangle:
        path.rectangle(args[0].as_num(), args[1].as_num(), args[2].as_num(),
                       args[3].as_num());
        break;

    case op_t::closePath:
        path.closePath();
        break;

        //
        // path painting operators
        //
    case op_t::endPath:
    case op_t::stroke:
    case op_t::closeStroke:
    case op_t::fill:
    case op_t::eoFill:
    case op_t::fillStroke:
    case op_t::closeFillStroke:
    case op_t::eoFillStroke:
    case op_t::closeEOFillStroke:
        opPaint(name);
        break;

    case op_t::shFill:
        (*once)("op:" + name, errUnimplemented, "Shading fills are not supported");
        break;

        //
        // path clipping operators
        //
    case op_t::clip:   opClip(fill_rule_t::winding); break;
    case op_t::eoClip: opClip(fill_rule_t::odd_even); break;

        //
        // text object operators
        //
    case op_t::beginText:
        inText = true;
        text.matrix = text.line_matrix = identity_matrix;
        break;

    case op_t::endText:
        inText = false;
        break;

        //
        // text state operators
        //
    case op_t::setCharSpacing:  text.char_spacing = args[0].as_num(); break;
    case op_t::setWordSpacing:  text.word_spacing = args[0].as_num(); break;
    case op_t::setHorizScaling: text.horiz_scaling = args[0].as_num() / 100; break;
    case op_t::setTextLeading:  text.leading = args[0].as_num(); break;
    case op_t::setTextRise:     text.rise = args[0].as_num(); break;
    case op_t::setTextRender:   text.render = args[0].as_int(); break;
    case op_t::setFont:         opSetFont(args); break;

        //
        // text positioning operators
        //
    case op_t::setTextMatrix:
        if (checkTextObject(name)) {
            matrix_t m;

            for (size_t i = 0; i < m.size(); ++i)
                m[i] = args[i].as_num();

            text.matrix = text.line_matrix = m;
        }
        break;

    case op_t::textMove:
        if (checkTextObject(name))
            opTextMove(args[0].as_num(), args[1].as_num());
        break;

    case op_t::textMoveSet:
        if (checkTextObject(name)) {
            text.leading = -args[1].as_num();
            opTextMove(args[0].as_num(), args[1].as_num());
        }
        break;

    case op_t::textNextLine:
        if (checkTextObject(name))
            opTextNextLine();
        break;

        //
        // text string operators
        //
    case op_t::showText:
        if (checkTextObject(name))
            doShowText(args[0].as_string());
        break;

    case op_t::moveShowText:
        if (checkTextObject(name)) {
            opTextNextLine();
            doShowText(args[0].as_string());
        }
        break;

    case op_t::moveSetShowText:
        if (checkTextObject(name)) {
            text.word_spacing = args[0].as_num();
            text.char_spacing = args[1].as_num();
            opTextNextLine();
            doShowText(args[2].as_string());
        }
        break;

    case op_t::showSpaceText:
        if (checkTextObject(name))
            opShowSpaceText(args);
        break;

        //
        // type 3 font operators
        //
    case op_t::setCharWidth:
    case op_t::setCacheDevice:
        break;

        //
        // XObject and in-line image operators
        //
    case op_t::xObject:    opXObject(args); break;
    case op_t::beginImage: opBeginImage(args); break;

    case op_t::imageData:
    case op_t::endImage:
        break;

        //
        // compatibility operators
        //
    case op_t::beginIgnoreUndef:
        ++ignoreUndef;
        break;

    case op_t::endIgnoreUndef:
        if (ignoreUndef > 0)
            --ignoreUndef;
        break;

        //
        // marked content operators
        //
    case op_t::beginMarkedContent:
    case op_t::endMarkedContent:
    case op_t::markPoint:
        break;
    }
}

//------------------------------------------------------------------------
// resources
//------------------------------------------------------------------------

const Resources *
Gfx::findXObject(const std::string &name, const xobject_t *&xobj) const
{
    for (auto iter = res.rbegin(); iter != res.rend(); ++iter) {
        if ((xobj = (*iter)->lookupXObject(name)))
            return iter->get();
    }

    return 0;
}

const std::string *Gfx::findFont(const std::string &name) const
{
    for (auto iter = res.rbegin(); iter != res.rend(); ++iter) {
        if (auto p = (*iter)->lookupFont(name))
            return p;
    }

    return 0;
}

const dict_t *Gfx::findGState(const std::string &name) const
{
    for (auto iter = res.rbegin(); iter != res.rend(); ++iter) {
        if (auto p = (*iter)->lookupGState(name))
            return p;
    }

    return 0;
}

//------------------------------------------------------------------------
// graphics state operators
//------------------------------------------------------------------------

void Gfx::opSave()
{
    saves.push_back(state.save());
    emit(draw_op_t::PushState);
}

//
// A restore without a save falls back to the state the stream started with
// and emits nothing:
//
void Gfx::opRestore()
{
    if (saves.empty()) {
        error(errSyntaxWarning, pos, "Restore without a matching save");
        state.restore(initial);
        return;
    }

    state.restore(std::move(saves.back()));
    saves.pop_back();

    emit(draw_op_t::PopState);
}

//
// The y axis flips here, once: b, c and f change sign.
//
void Gfx::opConcat(const obj_t args[])
{
    emit(draw_op_t::ConcatTransform,
         args[0].as_num(), -args[1].as_num(), -args[2].as_num(),
         args[3].as_num(), args[4].as_num(), -args[5].as_num());
}

void Gfx::opSetDash(const obj_t args[])
{
    if (!make_dash(args[0], state.dash)) {
        error(errSyntaxError, pos, "Bad dash array");
        return;
    }

    state.dash_phase = args[1].as_num();
}

void Gfx::opSetLineJoin(const obj_t args[])
{
    if (!assign(make_line_join(args[0].as_int()), state.line_join))
        error(errSyntaxError, pos, "Bad line join {0:d}", args[0].as_int());
}

void Gfx::opSetLineCap(const obj_t args[])
{
    if (!assign(make_line_cap(args[0].as_int()), state.line_cap))
        error(errSyntaxError, pos, "Bad line cap {0:d}", args[0].as_int());
}

void Gfx::opSetMiterLimit(const obj_t args[])
{
    state.miter_limit = args[0].as_num();
}

void Gfx::opSetLineWidth(const obj_t args[])
{
    state.setLineWidth(args[0].as_num());
}

void Gfx::opSetExtGState(const obj_t args[])
{
    const std::string name = args[0].as_name();

    const dict_t *dict = findGState(name);

    if (0 == dict) {
        (*once)("gs:" + name, errSyntaxError, "ExtGState '{0:s}' is unknown", name);
        return;
    }

    for (auto &[key, value] : *dict)
        doExtGStateKey(key, value, *dict);
}

void Gfx::doExtGStateKey(const std::string &key, const obj_t &value,
                         const dict_t &dict)
{
    bool ok = true;

    if (key == "LW") {
        if ((ok = value.is_num()))
            state.setLineWidth(value.as_num());
    } else if (key == "LC") {
        ok = value.is_int() &&
             assign(make_line_cap(value.as_int()), state.line_cap);
    } else if (key == "LJ") {
        ok = value.is_int() &&
             assign(make_line_join(value.as_int()), state.line_join);
    } else if (key == "ML") {
        if ((ok = value.is_num()))
            state.miter_limit = value.as_num();
    } else if (key == "D") {
        ok = value.is_array() && value.as_array().size() == 2 &&
             value[1].is_num() && make_dash(value[0], state.dash);

        if (ok)
            state.dash_phase = value[1].as_num();
    } else if (key == "CA") {
        if ((ok = value.is_num()))
            state.stroke_alpha = value.as_num();
    } else if (key == "ca") {
        if ((ok = value.is_num()))
            state.fill_alpha = value.as_num();
    } else if (key == "SA") {
        if ((ok = value.is_bool()))
            state.stroke_adjust = value.as_bool();
    } else if (key == "OP") {
        if ((ok = value.is_bool())) {
            state.overprint = value.as_bool();

            // op defaults to OP
            if (0 == dict.count("op"))
                state.overprint_ns = state.overprint;
        }
    } else if (key == "op") {
        if ((ok = value.is_bool()))
            state.overprint_ns = value.as_bool();
    } else if (key == "OPM") {
        if ((ok = value.is_int()))
            state.overprint_mode = value.as_int();
    } else if (key == "BM") {
        if (value.is_name())
            state.blend_mode = value.as_name();
        else if (value.is_array() && !value.as_array().empty() &&
                 value[0].is_name())
            state.blend_mode = value[0].as_name();
        else
            ok = false;
    } else if (key == "Type") {
        ok = value.is_name("ExtGState");
    } else {
        (*once)("gs-key:" + key, errUnimplemented,
                "ExtGState key '{0:s}' is not handled", key);
        return;
    }

    if (!ok)
        error(errSyntaxError, pos, "Bad value for ExtGState key '{0:s}'", key);
}

//------------------------------------------------------------------------
// color operators
//------------------------------------------------------------------------

//
// Selecting a colour space resets the colour to black:
//
void Gfx::opSetColorSpace(const obj_t args[], bool stroke)
{
    const std::string name = args[0].as_name();

    auto space = make_paint_space(name);

    if (!space) {
        (*once)("cs:" + name, errUnimplemented,
                "Colour space '{0:s}' is not supported", name);
        return;
    }

    (stroke ? state.stroke_space : state.fill_space) = *space;
    (stroke ? state.stroke : state.fill) = colour_t{ };
}

//
// The number of components picks the colour space: 1 gray, 3 RGB, 4 CMYK.
//
void Gfx::opSetColor(const obj_t args[], int numArgs, bool stroke)
{
    for (int i = 0; i < numArgs; ++i) {
        if (args[i].is_name()) {
            (*once)("pattern", errUnimplemented, "Pattern colours are not supported");
            return;
        }
    }

    colour_t colour;

    switch (numArgs) {
    case 1:
        colour = gray_colour(args[0].as_num());
        break;

    case 3:
        colour = rgb_colour(args[0].as_num(), args[1].as_num(), args[2].as_num());
        break;

    case 4:
        colour = cmyk_colour(args[0].as_num(), args[1].as_num(),
                             args[2].as_num(), args[3].as_num());
        break;

    default:
        error(errSyntaxError, pos,
              "Wrong number of colour components ({0:d})", numArgs);
        return;
    }

    (stroke ? state.stroke : state.fill) = colour;
}

//------------------------------------------------------------------------
// path painting and clipping operators
//------------------------------------------------------------------------

void Gfx::opPaint(const std::string &name)
{
    auto op = make_paint_op(name);

    if (!op) {
        error(errInternal, pos, "Unknown painting operator '{0:s}'", name);
        return;
    }

    if (pendingClip && !path.empty()) {
        state.clips.push_back(clip_t{ path.path(), *pendingClip });
    }

    pendingClip.reset();

    auto xs = path.resolve(*op, state);
    out.insert(out.end(), xs.begin(), xs.end());
}

//
// The clipping path is recorded at the next painting operator and never
// intersected with what is painted after it.
//
void Gfx::opClip(fill_rule_t rule)
{
    pendingClip = rule;
}

//------------------------------------------------------------------------
// text operators
//------------------------------------------------------------------------

bool Gfx::checkTextObject(const std::string &name)
{
    if (inText)
        return true;

    (*once)("text:" + name, errSyntaxWarning,
            "Operator '{0:s}' outside of a text object", name);

    return false;
}

void Gfx::opSetFont(const obj_t args[])
{
    const std::string name = args[0].as_name();

    auto &text = state.text;

    text.font = name;
    text.font_size = args[1].as_num();

    if (auto p = findFont(name)) {
        text.base_font = *p;
    } else {
        (*once)("font:" + name, errSyntaxError, "Unknown font tag '{0:s}'", name);

        // guessed from the resource name
        text.base_font = name;
    }
}

void Gfx::opTextMove(double tx, double ty)
{
    auto &text = state.text;

    text.line_matrix[4] += tx;
    text.line_matrix[5] += ty;

    text.matrix = text.line_matrix;
}

void Gfx::opTextNextLine()
{
    opTextMove(0, -state.text.leading);
}

//
// Kerning numbers in the array do not move the text position.
//
void Gfx::opShowSpaceText(const obj_t args[])
{
    for (auto &x : args[0].as_array()) {
        if (x.is_string())
            doShowText(x.as_string());
        else if (!x.is_num())
            error(errSyntaxError, pos,
                  "Element of show/space array must be number or string");
    }
}

void Gfx::doShowText(const std::string &s)
{
    const auto &text = state.text;

    const auto font = fonts.resolve(text.base_font, text.font_size);

    const auto metricsFont = scaled(font, params.getFontScaleMetrics());
    const auto sizeFont = scaled(font, params.getFontScaleSize());

    emit(draw_op_t::SetFont, sizeFont, state.fillColorWithAlpha());

    if (text.word_spacing != 0) {
        //
        // Every space byte ends a run, so consecutive, leading and trailing
        // spaces each produce a run of a single space:
        //
        for (size_t first = 0, second;; first = second + 1) {
            second = s.find(' ', first);

            doShowRun(s.substr(first, second - first) + " ", metricsFont,
                      sizeFont, font.known);

            if (second == std::string::npos)
                break;
        }
    } else {
        doShowRun(s, metricsFont, sizeFont, font.known);
    }
}

//
// Draws one run at the text position and advances the position by the run
// width plus the word spacing. The width comes from the precise metrics of
// a recognised font if the provider has them, else from the device extent
// of the metrics font.
//
void Gfx::doShowRun(const std::string &run, const font_t &metricsFont,
                    const font_t &font, bool known)
{
    auto &text = state.text;

    const double x = text.matrix[4];
    const double y = text.matrix[5] + text.rise;

    const auto extent = metrics.extent(run, metricsFont);

    double width = extent.width;

    if (known) {
        if (auto w = metrics.width(run, text.base_font, text.font_size))
            width = *w;
    }

    text.matrix[4] += width + text.word_spacing;

    auto cmd = make_command(
        draw_op_t::DrawText,
        { run, x, -y - (extent.height - extent.descent) });

    cmd.kwargs["font"] = font;
    cmd.kwargs["colour"] = state.fillColorWithAlpha();

    out.push_back(std::move(cmd));
}

//------------------------------------------------------------------------
// XObject operators
//------------------------------------------------------------------------

void Gfx::opXObject(const obj_t args[])
{
    const std::string name = args[0].as_name();

    const xobject_t *xobj = 0;
    const Resources *scope = findXObject(name, xobj);

    if (0 == scope) {
        (*once)("xobject:" + name, errSyntaxError, "XObject '{0:s}' is unknown", name);
        return;
    }

    if (auto p = std::get_if< image_ptr >(xobj)) {
        if (*p)
            doImage(**p, name);
    } else if (auto p = std::get_if< form_ptr >(xobj)) {
        if (*p)
            doForm(*p, name, scope);
    }
}

void Gfx::opBeginImage(const obj_t args[])
{
    doImage(make_image(args[0].as_dict(), args[1].as_string()), "inline");
}

//
// A failure stays with the image: it is reported and the page goes on.
//
void Gfx::doImage(const image_t &image, const std::string &name)
{
    try {
        auto result = decoder.decode(image);

        if (auto p = std::get_if< bitmap_ptr >(&result)) {
            const bitmap_ptr &bmp = *p;

            emit(draw_op_t::DrawBitmap, bmp, 0., -double(bmp->height),
                 double(bmp->width), double(bmp->height));

            return;
        }

        const auto &skip = std::get< skip_t >(result);

        switch (skip.reason) {
        case skip_reason_t::unsupported_colour_space:
        case skip_reason_t::unsupported_filter:
            (*once)(std::string(to_string(skip.reason)) + ":" + skip.what,
                    errUnimplemented, "Image '{0:s}' skipped: {1:s} ({2:s})",
                    name, to_string(skip.reason), skip.what);
            break;

        case skip_reason_t::decode_failure:
        case skip_reason_t::bad_geometry:
            error(errDecode, pos, "Image '{0:s}' skipped: {1:s} ({2:s})",
                  name, to_string(skip.reason), skip.what);
            break;
        }
    } catch (const std::exception &e) {
        error(errInternal, pos, "Image '{0:s}': {1:s}", name, e.what());
    }
}

//
// The form runs once per cache key, in a child interpreter which starts from
// the current state; the cached commands are spliced in at every reference.
//
void Gfx::doForm(const form_ptr &form, const std::string &name,
                 const Resources *scope)
{
    if (int(formStack.size()) >= params.getFormDepthLimit()) {
        error(errSyntaxError, pos, "Form '{0:s}' is nested too deeply", name);
        return;
    }

    if (find(formStack, form.get()) != formStack.end()) {
        error(errSyntaxError, pos, "Loop in form '{0:s}'", name);
        return;
    }

    const form_key_t key{ scope->scope, name };

    auto xs = cache.lookup(key);

    if (!xs) {
        const auto &m = form->matrix ? *form->matrix : identity_matrix;

        std::vector< operation_t > ops;
        ops.reserve(form->ops.size() + 3);

        ops.push_back(operation_t{ { }, "q" });
        ops.push_back(operation_t{
            { obj_t(m[0]), obj_t(m[1]), obj_t(m[2]), obj_t(m[3]), obj_t(m[4]),
              obj_t(m[5]) },
            "cm" });

        ops.insert(ops.end(), form->ops.begin(), form->ops.end());
        ops.push_back(operation_t{ { }, "Q" });

        Gfx child(*this, form->resources, form.get());
        xs = cache.insert(key, child.display(ops));
    }

    out.insert(out.end(), xs->begin(), xs->end());
}

} // namespace pdfdraw
