// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_ERROR_HH
#define PDFDRAW_PDFDRAW_ERROR_HH

#include <defs.hh>

#include <functional>
#include <set>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace pdfdraw {

enum ErrorCategory {
    errSyntaxWarning, // PDF syntax error which can be worked around;
                      //   output will probably be correct
    errSyntaxError,   // PDF syntax error which can be worked around;
                      //   output will probably be incorrect
    errConfig,        // error in pdfdrawrc config info
    errIO,            // error in file I/O
    errUnimplemented, // unimplemented PDF feature - display will be
                      //   incorrect
    errDecode,        // stream or image data could not be decoded
    errInternal       // internal error - malfunction within pdfdraw
};

const char *to_string(ErrorCategory);

using error_callback_t = std::function< void(ErrorCategory, long, const std::string &) >;

//
// Installs a receiver for all messages; an empty callback restores the
// default one, which prints to stderr:
//
void setErrorCallback(error_callback_t);

// Suppress the default callback output.
void setErrorQuiet(bool);
bool getErrorQuiet();

void emit_error(ErrorCategory, long pos, const std::string &);

template< typename... Args >
inline void error(ErrorCategory category, long pos, const char *fmt, Args &&... args)
{
    emit_error(category, pos,
               fmt::format(fmt::runtime(fmt), std::forward< Args >(args)...));
}

//
// Data error in a stream or an image; fails the decoding of one object:
//
struct decode_error : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

//
// Reports a message only the first time its key is seen; one registry lives
// as long as one interpreter (and the forms it expands):
//
class ErrorOnce
{
public:
    template< typename... Args >
    bool operator()(const std::string &key, ErrorCategory category,
                    const char *fmt, Args &&... args)
    {
        if (!seen_.insert(key).second)
            return false;

        error(category, -1, fmt, std::forward< Args >(args)...);
        return true;
    }

    bool seen(const std::string &key) const { return seen_.count(key); }
    size_t size() const { return seen_.size(); }

private:
    std::set< std::string > seen_;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_ERROR_HH
