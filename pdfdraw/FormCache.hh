// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_FORMCACHE_HH
#define PDFDRAW_PDFDRAW_FORMCACHE_HH

#include <defs.hh>

#include <map>
#include <memory>
#include <string>

#include <pdfdraw/DrawCommand.hh>

namespace pdfdraw {

//
// Identifies a form expansion: the scope of the resources the form was
// found in, and its resource name. The host picks the scope granularity
// when it names its resource scopes.
//
struct form_key_t
{
    std::string scope, name;
};

bool operator<(const form_key_t &, const form_key_t &);

//
// Expanded forms for one document session. Cached lists are immutable and
// shared with the callers; a cache is not meant to be shared between
// threads.
//
class FormCache
{
public:
    using value_type = std::shared_ptr< const draw_list_t >;

    // Null when the form was not expanded yet.
    value_type lookup(const form_key_t &) const;

    //
    // Stores an expansion, replacing any previous one, and counts it:
    //
    value_type insert(const form_key_t &, draw_list_t);

    size_t expansions() const { return expansions_; }
    size_t size() const { return cache_.size(); }

    void clear();

private:
    std::map< form_key_t, value_type > cache_;
    size_t expansions_ = 0;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_FORMCACHE_HH
