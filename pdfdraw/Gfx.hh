// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_GFX_HH
#define PDFDRAW_PDFDRAW_GFX_HH

#include <defs.hh>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <pdfdraw/DrawCommand.hh>
#include <pdfdraw/Error.hh>
#include <pdfdraw/FontResolver.hh>
#include <pdfdraw/FormCache.hh>
#include <pdfdraw/GfxState.hh>
#include <pdfdraw/GlobalParams.hh>
#include <pdfdraw/ImageDecoder.hh>
#include <pdfdraw/PathAccumulator.hh>
#include <pdfdraw/Resources.hh>
#include <pdfdraw/TextMetrics.hh>
#include <pdfdraw/obj.hh>

namespace pdfdraw {

//------------------------------------------------------------------------
// Gfx
//------------------------------------------------------------------------

//
// Interprets the tokenized content stream of a page or of a form and
// produces the draw commands for it.
//
class Gfx
{
public:
    static constexpr int maxArgs = 33;

    enum typeCheckType {
        typeCheckBool,   // boolean
        typeCheckInt,    // integer
        typeCheckNum,    // number (integer or real)
        typeCheckString, // string
        typeCheckName,   // name
        typeCheckArray,  // array
        typeCheckDict,   // dictionary
        typeCheckProps,  // properties (dictionary or name)
        typeCheckSCN,    // scn/SCN args (number of name)
        typeCheckNone    // used to avoid empty initializer lists
    };

    enum struct op_t {
        moveSetShowText, moveShowText, fillStroke, eoFillStroke,
        beginMarkedContent, beginImage, beginText, beginIgnoreUndef,
        setStrokeColorSpace, markPoint, xObject, endImage, endMarkedContent,
        endText, endIgnoreUndef, fill, setStrokeGray, imageData, setLineCap,
        setStrokeCMYKColor, setMiterLimit, restore, setStrokeRGBColor,
        stroke, setStrokeColor, setStrokeColorN, textNextLine, textMoveSet,
        showSpaceText, setTextLeading, setCharSpacing, textMove, setFont,
        showText, setTextMatrix, setTextRender, setTextRise, setWordSpacing,
        setHorizScaling, clip, eoClip, closeFillStroke, closeEOFillStroke,
        curveTo, concat, setFillColorSpace, setDash, setCharWidth,
        setCacheDevice, eoFill, setFillGray, setExtGState, closePath,
        setFlat, setLineJoin, setFillCMYKColor, lineTo, moveTo, endPath,
        save, rectangle, setFillRGBColor, setRenderingIntent, closeStroke,
        setFillColor, setFillColorN, shFill, curveTo1, setLineWidth, curveTo2
    };

    struct Operator
    {
        char          name[4];
        int           numArgs;
        typeCheckType tchk[maxArgs];
        op_t          op;
    };

    // Sorted by name.
    static const Operator opTab[];
    static const size_t numOps;

    static const Operator *findOp(const char *name);

public:
    Gfx(const GlobalParams &, const TextMetrics &, FormCache &, FontResolver &,
        std::shared_ptr< const Resources >, filter_codecs_t = { });

    //
    // Interprets one content stream and returns its commands, after the
    // transform fold. Saves left open at the end are closed.
    //
    draw_list_t display(const std::vector< operation_t > &);

    const GfxState &getState() const { return state; }

    size_t getSaveDepth() const { return saves.size(); }

    bool inTextObject() const { return inText; }

    const ErrorOnce &getReported() const { return *once; }

private:
    // Form expansion: shares the session collaborators of the parent.
    Gfx(const Gfx &parent, std::shared_ptr< const Resources >, const form_t *);

    void go(const std::vector< operation_t > &);
    bool execOp(const operation_t &);
    bool checkArg(const obj_t &, typeCheckType) const;
    void printCommand(const operation_t &) const;

    void dispatch(op_t, const std::string &, const obj_t args[], int numArgs);

    template< typename... Args >
    void emit(draw_op_t op, Args &&... args)
    {
        out.push_back(make_command(op, { arg_t(std::forward< Args >(args))... }));
    }

    // resource lookup, innermost scope first
    const Resources *findXObject(const std::string &, const xobject_t *&) const;
    const std::string *findFont(const std::string &) const;
    const dict_t *findGState(const std::string &) const;

    // graphics state operators
    void opSave();
    void opRestore();
    void opConcat(const obj_t args[]);
    void opSetDash(const obj_t args[]);
    void opSetLineJoin(const obj_t args[]);
    void opSetLineCap(const obj_t args[]);
    void opSetMiterLimit(const obj_t args[]);
    void opSetLineWidth(const obj_t args[]);
    void opSetExtGState(const obj_t args[]);
    void doExtGStateKey(const std::string &, const obj_t &, const dict_t &);

    // color operators
    void opSetColorSpace(const obj_t args[], bool stroke);
    void opSetColor(const obj_t args[], int numArgs, bool stroke);

    // path operators
    void opPaint(const std::string &);
    void opClip(fill_rule_t);

    // text operators
    bool checkTextObject(const std::string &);
    void opSetFont(const obj_t args[]);
    void opTextMove(double tx, double ty);
    void opTextNextLine();
    void opShowSpaceText(const obj_t args[]);
    void doShowText(const std::string &);
    void doShowRun(const std::string &, const font_t &metricsFont,
                   const font_t &font, bool known);

    // XObject operators
    void opXObject(const obj_t args[]);
    void opBeginImage(const obj_t args[]);
    void doImage(const image_t &, const std::string &);
    void doForm(const form_ptr &, const std::string &, const Resources *);

private:
    const GlobalParams &params;
    const TextMetrics &metrics;

    FormCache &cache;
    FontResolver &fonts;

    std::shared_ptr< ErrorOnce > once;

    // resource stack, outermost first
    std::vector< std::shared_ptr< const Resources > > res;

    ImageDecoder decoder;

    GfxState initial, state;
    std::vector< GfxState > saves;

    PathAccumulator path;
    std::optional< fill_rule_t > pendingClip;

    bool inText = false;

    // current BX/EX nesting level
    int ignoreUndef = 0;

    // forms being expanded, outermost first
    std::vector< const form_t * > formStack;

    // position of the current operator in its stream
    long pos = -1;

    draw_list_t out;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_GFX_HH
