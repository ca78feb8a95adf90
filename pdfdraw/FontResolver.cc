// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <iterator>

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
using namespace ranges;

#include <utils/string.hh>

#include <pdfdraw/FontResolver.hh>

namespace pdfdraw {
namespace {

struct base14_family_t
{
    const char   *key; // lower case, anywhere in the name
    const char   *face;
    font_family_t family;
};

const base14_family_t base14_families[] = {
    { "courier",      "Courier New",     font_family_t::modern   },
    { "helvetica",    "Arial",           font_family_t::swiss    },
    { "times",        "Times New Roman", font_family_t::roman    },
    { "symbol",       "Symbol",          font_family_t::default_ },
    { "zapfdingbats", "Wingdings",       font_family_t::default_ },
    { "arial",        "Arial",           font_family_t::swiss    }
};

} // anonymous

std::string strip_subset_tag(const std::string &s)
{
    if (s.size() > 7 && s[6] == '+' &&
        all_of(s.begin(), s.begin() + 6, [](unsigned char c) {
            return isupper(c);
        }))
        return s.substr(7);

    return s;
}

font_t FontResolver::resolve(const std::string &base_font, double size)
{
    const auto name = lower(strip_subset_tag(base_font));

    font_t font;
    font.size = (std::max)(size, 1.);

    auto iter = find_if(base14_families, [&](auto &x) {
        return contains(name, x.key);
    });

    if (iter == std::end(base14_families)) {
        font.face   = "Arial";
        font.family = font_family_t::swiss;
        font.known  = false;

        missing_.insert(base_font);
    } else {
        font.face   = iter->face;
        font.family = iter->family;
        font.known  = true;
    }

    if (contains(name, "bold"))
        font.weight = font_weight_t::bold;

    if (contains(name, "italic") || contains(name, "oblique"))
        font.style = font_style_t::italic;

    return font;
}

font_t scaled(font_t font, double factor)
{
    font.size *= factor;
    return font;
}

} // namespace pdfdraw
