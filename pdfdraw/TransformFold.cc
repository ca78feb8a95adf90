// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfdraw/TransformFold.hh>

namespace pdfdraw {
namespace {

bool foldable(const draw_command_t &ct, const draw_command_t &bm)
{
    if (ct.op != draw_op_t::ConcatTransform || bm.op != draw_op_t::DrawBitmap)
        return false;

    if (ct.args.size() != 6 || bm.args.size() != 5 || bm.has("folded"))
        return false;

    return ct.num(0) != 0 && ct.num(3) != 0;
}

} // anonymous

draw_list_t fold_transforms(draw_list_t xs)
{
    for (size_t i = 0; i + 1 < xs.size(); ++i) {
        auto &ct = xs[i];
        auto &bm = xs[i + 1];

        if (!foldable(ct, bm))
            continue;

        const double w = ct.num(0), h = ct.num(3);

        bm.args[2] = -h;
        bm.args[3] = w;
        bm.args[4] = h;
        bm.kwargs["folded"] = 1.;

        ct.args[0] = 1.;
        ct.args[1] = ct.num(1) / w;
        ct.args[2] = ct.num(2) / h;
        ct.args[3] = 1.;

        ++i;
    }

    return xs;
}

} // namespace pdfdraw
