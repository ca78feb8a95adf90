// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <csetjmp>
#include <cstdio>
#include <stdexcept>

#include <jpeglib.h>

#include <pdfdraw/Error.hh>
#include <pdfdraw/ImageDecoder.hh>
#include <pdfdraw/bitpack.hh>

namespace pdfdraw {
namespace {

//------------------------------------------------------------------------
// libjpeg glue
//------------------------------------------------------------------------

struct jpeg_error_t
{
    jpeg_error_mgr pub;
    jmp_buf jmp;
    char msg[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr cinfo)
{
    auto err = reinterpret_cast< jpeg_error_t * >(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    longjmp(err->jmp, 1);
}

void on_jpeg_message(j_common_ptr cinfo)
{
    char buf[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buf);
    error(errSyntaxWarning, -1, "JPEG: {0:s}", buf);
}

//
// The two functions below hold no objects with destructors in the frames
// that libjpeg may longjmp to:
//
bool start_jpeg(jpeg_decompress_struct *cinfo, const unsigned char *p, size_t n)
{
    auto err = reinterpret_cast< jpeg_error_t * >(cinfo->err);

    if (setjmp(err->jmp))
        return false;

    jpeg_mem_src(cinfo, const_cast< unsigned char * >(p), (unsigned long)n);
    jpeg_read_header(cinfo, TRUE);

    switch (cinfo->num_components) {
    case 1: cinfo->out_color_space = JCS_GRAYSCALE; break;
    case 4: cinfo->out_color_space = JCS_CMYK; break;
    default:
        cinfo->out_color_space = JCS_RGB;
        break;
    }

    jpeg_start_decompress(cinfo);

    return true;
}

bool read_jpeg(jpeg_decompress_struct *cinfo, unsigned char *pdst, size_t stride)
{
    auto err = reinterpret_cast< jpeg_error_t * >(cinfo->err);

    if (setjmp(err->jmp))
        return false;

    while (cinfo->output_scanline < cinfo->output_height) {
        JSAMPROW row = pdst + cinfo->output_scanline * stride;
        jpeg_read_scanlines(cinfo, &row, 1);
    }

    jpeg_finish_decompress(cinfo);

    return true;
}

std::string to_rgb(const std::string &xs, int components, bool inverted)
{
    if (components == 3)
        return xs;

    std::string rgb;
    rgb.reserve(xs.size() / components * 3);

    for (size_t i = 0; i + components <= xs.size(); i += components) {
        if (components == 1) {
            rgb.append(3, xs[i]);
        } else {
            auto f = [&](size_t j) {
                const double x = (unsigned char)xs[i + j] / 255.;
                return inverted ? 1 - x : x;
            };

            const auto c = cmyk_colour(f(0), f(1), f(2), f(3));

            rgb += char(c.r);
            rgb += char(c.g);
            rgb += char(c.b);
        }
    }

    return rgb;
}

bool supported_depth(int bits)
{
    return bits == 1 || bits == 2 || bits == 4 || bits == 8;
}

//
// The reason an image colour space and depth combination can not be
// resolved to RGB, or an empty string:
//
std::string unsupported(const image_t &img)
{
    const auto &cs = img.colour_space;

    if (img.image_mask)
        return img.bits == 1 ? "" : fmt::format("ImageMask/{0:d}", img.bits);

    switch (cs.kind) {
    case colour_space_kind_t::device_rgb:
        return img.bits == 8 ? "" : fmt::format("DeviceRGB/{0:d}", img.bits);

    case colour_space_kind_t::device_gray:
        return supported_depth(img.bits)
            ? "" : fmt::format("DeviceGray/{0:d}", img.bits);

    case colour_space_kind_t::indexed:
        return supported_depth(img.bits)
            ? "" : fmt::format("Indexed/{0:d}", img.bits);

    case colour_space_kind_t::none:
        return img.bits == 1 ? "" : fmt::format("none/{0:d}", img.bits);

    case colour_space_kind_t::unsupported:
        break;
    }

    return cs.base_name.empty() ? cs.name : cs.name + "/" + cs.base_name;
}

} // anonymous

const char *to_string(skip_reason_t x)
{
    static const char *arr[] = {
        "unsupported colour space", "unsupported filter", "decode failure",
        "bad geometry"
    };

    return arr[size_t(x)];
}

bitmap_ptr decode_jpeg(const std::string &data)
{
    jpeg_decompress_struct cinfo;
    jpeg_error_t err;
    err.msg[0] = 0;

    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = on_jpeg_error;
    err.pub.output_message = on_jpeg_message;

    jpeg_create_decompress(&cinfo);

    if (!start_jpeg(&cinfo, (const unsigned char *)data.data(), data.size())) {
        jpeg_destroy_decompress(&cinfo);
        throw decode_error(std::string("JPEG: ") + err.msg);
    }

    const int width = cinfo.output_width, height = cinfo.output_height;
    const int components = cinfo.output_components;

    const bool inverted = cinfo.saw_Adobe_marker;

    std::string buf(size_t(width) * height * components, '\0');

    if (!read_jpeg(&cinfo, (unsigned char *)&buf[0], size_t(width) * components)) {
        jpeg_destroy_decompress(&cinfo);
        throw decode_error(std::string("JPEG: ") + err.msg);
    }

    jpeg_destroy_decompress(&cinfo);

    if (components != 1 && components != 3 && components != 4)
        throw decode_error(fmt::format("JPEG: {0:d} components", components));

    return std::make_shared< bitmap_t >(
        width, height, to_rgb(buf, components, inverted));
}

size_t apply_colour_key(bitmap_t &bmp, const std::vector< int > &key)
{
    if (key.size() != 6)
        throw std::invalid_argument(fmt::format(
            "colour-key mask with {0:d} values", key.size()));

    auto within = [&](unsigned char c, size_t i) {
        return int(c) >= key[i] && int(c) <= key[i + 1];
    };

    auto clamp = [](int x) {
        return (unsigned char)(x < 0 ? 0 : x > 255 ? 255 : x);
    };

    const colour_t c{ clamp(key[1]), clamp(key[3]), clamp(key[5]) };

    size_t n = 0;
    auto &xs = bmp.rgb;

    for (size_t i = 0; i + 2 < xs.size(); i += 3) {
        auto r = (unsigned char)xs[i];
        auto g = (unsigned char)xs[i + 1];
        auto b = (unsigned char)xs[i + 2];

        if (within(r, 0) && within(g, 2) && within(b, 4)) {
            xs[i]     = char(c.r);
            xs[i + 1] = char(c.g);
            xs[i + 2] = char(c.b);

            ++n;
        }
    }

    bmp.key = c;

    return n;
}

bitmap_ptr ImageDecoder::do_decode(const image_t &img) const
{
    const auto data = decode_filters(img.data, img.filters, codecs_);

    if (img.filters.has(filter_t::dct))
        return decode_jpeg(data);

    const size_t width = img.width, height = img.height;
    const auto &cs = img.colour_space;

    std::string rgb;

    if (img.image_mask) {
        rgb = deindex(data, width, height, 1, bw_palette());
    } else {
        switch (cs.kind) {
        case colour_space_kind_t::device_rgb:
            if (data.size() < width * height * 3)
                throw decode_error(fmt::format(
                    "short RGB data: {0:d} bytes, expected {1:d}", data.size(),
                    width * height * 3));

            rgb = data.substr(0, width * height * 3);
            break;

        case colour_space_kind_t::indexed:
            rgb = deindex(data, width, height, img.bits,
                          cs.base == colour_space_kind_t::device_gray
                          ? gray_to_rgb_palette(cs.lookup) : cs.lookup);
            break;

        case colour_space_kind_t::device_gray:
            rgb = deindex(data, width, height, img.bits, gray_palette(img.bits));
            break;

        case colour_space_kind_t::none:
            rgb = deindex(data, width, height, 1, bw_palette());
            break;

        case colour_space_kind_t::unsupported:
            throw std::invalid_argument("unsupported colour space");
        }
    }

    return std::make_shared< bitmap_t >(img.width, img.height, std::move(rgb));
}

mask_t ImageDecoder::decode_mask(const image_t &img) const
{
    if (img.width <= 0 || img.height <= 0)
        throw decode_error(fmt::format(
            "bad mask geometry: {0:d}x{1:d}", img.width, img.height));

    const auto data = decode_filters(img.data, img.filters, codecs_);
    const auto rgb = deindex(data, img.width, img.height, 1, bw_palette());

    mask_t mask{ img.width, img.height, std::string(rgb.size() / 3, '\0') };

    for (size_t i = 0; i < mask.alpha.size(); ++i)
        mask.alpha[i] = rgb[3 * i] ? char(0) : char(0xFF);

    return mask;
}

image_result_t ImageDecoder::decode(const image_t &img) const
{
    if (!img.colour_key.empty() && img.colour_key.size() != 6)
        throw std::invalid_argument(fmt::format(
            "colour-key mask with {0:d} values", img.colour_key.size()));

    const bool dct = img.filters.has(filter_t::dct);

    if (!dct) {
        if (img.width <= 0 || img.height <= 0)
            return skip_t{ skip_reason_t::bad_geometry,
                           fmt::format("{0:d}x{1:d}", img.width, img.height) };

        auto what = unsupported(img);

        if (!what.empty())
            return skip_t{ skip_reason_t::unsupported_colour_space, what };
    }

    bitmap_ptr bmp;

    try {
        bmp = do_decode(img);

        if (img.mask)
            bmp->mask = decode_mask(*img.mask);
    }
    catch (const unsupported_filter_error &e) {
        return skip_t{ skip_reason_t::unsupported_filter, e.name };
    }
    catch (const decode_error &e) {
        return skip_t{ skip_reason_t::decode_failure, e.what() };
    }

    if (!img.colour_key.empty())
        apply_colour_key(*bmp, img.colour_key);

    return bmp;
}

} // namespace pdfdraw
