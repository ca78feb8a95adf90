// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_TRANSFORMFOLD_HH
#define PDFDRAW_PDFDRAW_TRANSFORMFOLD_HH

#include <defs.hh>

#include <pdfdraw/DrawCommand.hh>

namespace pdfdraw {

//
// Moves the scale of a ConcatTransform into the DrawBitmap immediately
// following it:
//
//   ConcatTransform a b c d e f, DrawBitmap bmp x y w0 h0
//
// becomes
//
//   ConcatTransform 1 b/a c/d 1 e f, DrawBitmap bmp x -d a d folded=1
//
// A bitmap already folded, or a transform with a zero diagonal, is left
// alone. Nothing else is rewritten.
//
draw_list_t fold_transforms(draw_list_t);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_TRANSFORMFOLD_HH
