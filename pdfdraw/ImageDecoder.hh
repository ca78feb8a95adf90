// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_IMAGEDECODER_HH
#define PDFDRAW_PDFDRAW_IMAGEDECODER_HH

#include <defs.hh>

#include <string>
#include <variant>
#include <vector>

#include <pdfdraw/Bitmap.hh>
#include <pdfdraw/Filters.hh>
#include <pdfdraw/Image.hh>

namespace pdfdraw {

enum struct skip_reason_t {
    unsupported_colour_space, unsupported_filter, decode_failure, bad_geometry
};

const char *to_string(skip_reason_t);

//
// Why an image produced no bitmap; `what' names the cause (colour space,
// filter, or the decoder message):
//
struct skip_t
{
    skip_reason_t reason;
    std::string what;
};

using image_result_t = std::variant< bitmap_ptr, skip_t >;

//
// Applies a colour-key mask: every pixel with all three components within
// their [low, high] ranges is replaced by the (high, high, high) key colour,
// which becomes the transparent colour of the bitmap. Returns the number of
// pixels replaced. Throws std::invalid_argument unless given 6 values.
//
size_t apply_colour_key(bitmap_t &, const std::vector< int > &);

//
// JPEG (DCT) data, 1, 3 or 4 components, to RGB. Throws decode_error.
//
bitmap_ptr decode_jpeg(const std::string &);

//
// Filter decode, colour resolution, and masking of one image. Data problems
// are returned as a skip; std::invalid_argument is thrown for a malformed
// colour-key mask.
//
class ImageDecoder
{
public:
    explicit ImageDecoder(filter_codecs_t codecs = { })
        : codecs_(std::move(codecs))
    { }

    image_result_t decode(const image_t &) const;

private:
    bitmap_ptr do_decode(const image_t &) const;
    mask_t decode_mask(const image_t &) const;

private:
    filter_codecs_t codecs_;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_IMAGEDECODER_HH
