// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cctype>
#include <string>
#include <vector>

#include <utils/string.hh>

#include <range/v3/algorithm/transform.hpp>

namespace pdfdraw {

std::vector< std::string > tokenize(const std::string &s)
{
    std::vector< std::string > xs;

    const char *p1 = s.c_str(), *p2;

    while (*p1) {
        for (; *p1 && isspace((unsigned char)*p1); ++p1)
            ;

        if (!*p1)
            break;

        if (*p1 == '"' || *p1 == '\'') {
            for (p2 = p1 + 1; *p2 && *p2 != *p1; ++p2)
                ;
            ++p1;
        } else {
            for (p2 = p1 + 1; *p2 && !isspace((unsigned char)*p2); ++p2)
                ;
        }

        xs.emplace_back(p1, p2 - p1);
        p1 = *p2 ? p2 + 1 : p2;
    }

    return xs;
}

std::string lower(std::string s)
{
    ranges::transform(s, s.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });

    return s;
}

} // namespace pdfdraw
