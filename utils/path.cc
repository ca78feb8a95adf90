// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#include <defs.hh>

#include <cstdlib>
#include <memory>

#include <pwd.h>
#include <unistd.h>
#include <sys/types.h>
#include <wordexp.h>

#include <utils/path.hh>

namespace pdfdraw {

fs::path home_path()
{
    if (const char *s = getenv("HOME")) {
        return fs::path(s);
    } else {
        struct passwd *p = 0;

        if (const char *s = getenv("USER"))
            p = getpwnam(s);
        else
            p = getpwuid(getuid());

        return p ? fs::path(p->pw_dir) : fs::path(".");
    }
}

fs::path expand_path(const fs::path &path)
{
    wordexp_t w{ };

    int result = wordexp(
        path.c_str(), &w, WRDE_NOCMD | WRDE_SHOWERR | WRDE_UNDEF);

    std::unique_ptr< ::wordexp_t, void(*)(::wordexp_t*) > guard(
        &w, ::wordfree);

    if (0 == result && 1 == w.we_wordc)
        return fs::path(w.we_wordv[0]);

    return path;
}

} // namespace pdfdraw
