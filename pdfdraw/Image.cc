// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfdraw/Image.hh>

namespace pdfdraw {
namespace {

colour_space_kind_t device_kind(const std::string &s)
{
    if (s == "DeviceGray" || s == "G")
        return colour_space_kind_t::device_gray;

    if (s == "DeviceRGB" || s == "RGB")
        return colour_space_kind_t::device_rgb;

    return colour_space_kind_t::unsupported;
}

const std::string &expand_name(const std::string &s)
{
    static const std::map< std::string, std::string > abbrevs{
        { "G", "DeviceGray" }, { "RGB", "DeviceRGB" }, { "CMYK", "DeviceCMYK" },
        { "I", "Indexed" }
    };

    auto iter = abbrevs.find(s);
    return iter == abbrevs.end() ? s : iter->second;
}

filter_chain_t make_filter_chain(const obj_t &filters, const obj_t &parms)
{
    filter_chain_t chain;

    if (filters.is_name()) {
        chain.names.emplace_back(filters.as_name());
    } else if (filters.is_array()) {
        for (auto &x : filters.as_array())
            if (x.is_name())
                chain.names.emplace_back(x.as_name());
    }

    if (parms.is_dict()) {
        chain.parms.push_back(parms.as_dict());
    } else if (parms.is_array()) {
        for (auto &x : parms.as_array())
            chain.parms.push_back(x.is_dict() ? x.as_dict() : dict_t{ });
    }

    chain.parms.resize(chain.names.size());

    return chain;
}

} // anonymous

colour_space_t make_colour_space(const obj_t &obj)
{
    colour_space_t cs;

    if (obj.is_name()) {
        cs.name = expand_name(obj.as_name());
        cs.kind = device_kind(obj.as_name());
    } else if (obj.is_array() && !obj.as_array().empty() && obj[0].is_name()) {
        auto &arr = obj.as_array();

        cs.name = expand_name(arr[0].as_name());
        cs.kind = colour_space_kind_t::unsupported;

        if (cs.name == "Indexed" && arr.size() == 4) {
            auto base = make_colour_space(arr[1]);

            cs.base = base.kind;
            cs.base_name = base.name;

            if (base.kind == colour_space_kind_t::device_gray ||
                base.kind == colour_space_kind_t::device_rgb)
                cs.kind = colour_space_kind_t::indexed;

            if (arr[2].is_num())
                cs.hival = int(arr[2].as_num());

            if (arr[3].is_string())
                cs.lookup = arr[3].as_string();
        }
    }

    return cs;
}

image_t make_image(const dict_t &dict, std::string data)
{
    image_t img;

    auto as_int = [](const obj_t &x) { return x.is_num() ? int(x.as_num()) : 0; };

    img.width  = as_int(lookup(dict, "Width", "W"));
    img.height = as_int(lookup(dict, "Height", "H"));
    img.bits   = as_int(lookup(dict, "BitsPerComponent", "BPC"));

    const auto &im = lookup(dict, "ImageMask", "IM");
    img.image_mask = im.is_bool() && im.as_bool();

    if (img.image_mask)
        img.bits = 1;

    img.colour_space = make_colour_space(lookup(dict, "ColorSpace", "CS"));
    img.filters = make_filter_chain(
        lookup(dict, "Filter", "F"), lookup(dict, "DecodeParms", "DP"));

    const auto &mask = lookup(dict, "Mask");

    if (mask.is_array()) {
        for (auto &x : mask.as_array())
            img.colour_key.push_back(as_int(x));
    } else if (mask.is_dict()) {
        const auto &mask_dict = mask.as_dict();
        const auto &mask_data = lookup(mask_dict, "Data");

        img.mask = std::make_shared< image_t >(make_image(
            mask_dict, mask_data.is_string() ? mask_data.as_string() : ""));

        if (0 == img.mask->bits)
            img.mask->bits = 1;
    }

    img.data = std::move(data);

    return img;
}

} // namespace pdfdraw
