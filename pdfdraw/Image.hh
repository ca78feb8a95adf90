// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_IMAGE_HH
#define PDFDRAW_PDFDRAW_IMAGE_HH

#include <defs.hh>

#include <memory>
#include <string>
#include <vector>

#include <pdfdraw/Filters.hh>
#include <pdfdraw/obj.hh>

namespace pdfdraw {

//------------------------------------------------------------------------
// colour_space_t
//------------------------------------------------------------------------

enum struct colour_space_kind_t {
    none, device_gray, device_rgb, indexed, unsupported
};

struct colour_space_t
{
    colour_space_kind_t kind = colour_space_kind_t::none;

    // declared name (DeviceCMYK, ICCBased, ...), for reports
    std::string name;

    // Indexed only
    colour_space_kind_t base = colour_space_kind_t::none;
    std::string base_name;
    int hival = 0;
    std::string lookup;
};

//
// From a name (full or abbreviated) or an [/Indexed base hival lookup] array:
//
colour_space_t make_colour_space(const obj_t &);

//------------------------------------------------------------------------
// image_t
//------------------------------------------------------------------------

struct image_t
{
    int width = 0, height = 0, bits = 0;

    colour_space_t colour_space;
    filter_chain_t filters;

    // a stencil mask, 1 bit per sample, no colour space
    bool image_mask = false;

    // colour-key mask, low and high per component, or empty
    std::vector< int > colour_key;

    // explicit mask
    std::shared_ptr< image_t > mask;

    // encoded samples
    std::string data;
};

//
// Builds an image from its dictionary, with full (image XObjects) or
// abbreviated (inline images) keys and values. A /Mask given as a dictionary
// carries the mask samples in a /Data string entry.
//
image_t make_image(const dict_t &, std::string data);

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_IMAGE_HH
