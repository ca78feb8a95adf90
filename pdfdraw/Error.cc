// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdio>

#include <pdfdraw/Error.hh>

namespace pdfdraw {
namespace {

const char *errorCategoryNames[] = {
    "Syntax Warning",
    "Syntax Error",
    "Config Error",
    "I/O Error",
    "Unimplemented Feature",
    "Decode Error",
    "Internal Error"
};

bool errQuiet = false;
error_callback_t errorCbk;

void default_callback(ErrorCategory category, long pos, const std::string &msg)
{
    if (errQuiet)
        return;

    if (pos >= 0)
        fmt::print(stderr, "{} ({}): {}\n", to_string(category), pos, msg);
    else
        fmt::print(stderr, "{}: {}\n", to_string(category), msg);

    fflush(stderr);
}

} // anonymous

const char *to_string(ErrorCategory category)
{
    return errorCategoryNames[category];
}

void setErrorCallback(error_callback_t cbk)
{
    errorCbk = std::move(cbk);
}

void setErrorQuiet(bool value)
{
    errQuiet = value;
}

bool getErrorQuiet()
{
    return errQuiet;
}

void emit_error(ErrorCategory category, long pos, const std::string &msg)
{
    if (errorCbk)
        errorCbk(category, pos, msg);
    else
        default_callback(category, pos, msg);
}

} // namespace pdfdraw
