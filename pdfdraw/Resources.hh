// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_RESOURCES_HH
#define PDFDRAW_PDFDRAW_RESOURCES_HH

#include <defs.hh>

#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <pdfdraw/GfxState.hh>
#include <pdfdraw/Image.hh>
#include <pdfdraw/obj.hh>

namespace pdfdraw {

struct Resources;

//
// A form XObject: its tokenized content, bounding box, matrix, and its own
// resources (null when the form inherits those of the caller):
//
struct form_t
{
    std::vector< operation_t > ops;

    std::array< double, 4 > bbox{ };
    std::optional< matrix_t > matrix;

    std::shared_ptr< const Resources > resources;
};

using image_ptr = std::shared_ptr< const image_t >;
using form_ptr  = std::shared_ptr< const form_t >;

using xobject_t = std::variant< image_ptr, form_ptr >;

//------------------------------------------------------------------------
// Resources
//------------------------------------------------------------------------

//
// The resources of a page or a form, as delivered by the resource resolver.
// The scope string identifies the owner (a page, a form) and is the first
// half of the form cache key:
//
struct Resources
{
    std::string scope;

    // font resource name -> base font
    std::map< std::string, std::string > fonts;

    std::map< std::string, xobject_t > xobjects;

    // ExtGState resource name -> parameter dictionary
    std::map< std::string, dict_t > gstates;

    const std::string *lookupFont(const std::string &) const;
    const xobject_t *lookupXObject(const std::string &) const;
    const dict_t *lookupGState(const std::string &) const;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_RESOURCES_HH
