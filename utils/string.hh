// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_UTILS_STRING_HH
#define PDFDRAW_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace pdfdraw {

//
// Splits a config line in tokens; a token starting with a double or single
// quote extends up to the matching quote:
//
std::vector< std::string > tokenize(const std::string &s);

std::string lower(std::string s);

inline bool contains(const std::string &s, const char *what)
{
    return std::string::npos != s.find(what);
}

} // namespace pdfdraw

#endif // PDFDRAW_UTILS_STRING_HH
