// -*- mode: c++; -*-
// Copyright 1996-2013 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <pdfdraw/Resources.hh>

namespace pdfdraw {
namespace {

template< typename T >
const T *lookup_in(const std::map< std::string, T > &xs, const std::string &name)
{
    auto iter = xs.find(name);
    return iter == xs.end() ? nullptr : &iter->second;
}

} // anonymous

const std::string *Resources::lookupFont(const std::string &name) const
{
    return lookup_in(fonts, name);
}

const xobject_t *Resources::lookupXObject(const std::string &name) const
{
    return lookup_in(xobjects, name);
}

const dict_t *Resources::lookupGState(const std::string &name) const
{
    return lookup_in(gstates, name);
}

} // namespace pdfdraw
