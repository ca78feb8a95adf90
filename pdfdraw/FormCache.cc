// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <tuple>

#include <pdfdraw/FormCache.hh>

namespace pdfdraw {

bool operator<(const form_key_t &lhs, const form_key_t &rhs)
{
    return std::tie(lhs.scope, lhs.name) < std::tie(rhs.scope, rhs.name);
}

FormCache::value_type FormCache::lookup(const form_key_t &key) const
{
    auto iter = cache_.find(key);
    return iter == cache_.end() ? value_type{ } : iter->second;
}

FormCache::value_type FormCache::insert(const form_key_t &key, draw_list_t xs)
{
    auto p = std::make_shared< const draw_list_t >(std::move(xs));

    cache_[key] = p;
    ++expansions_;

    return p;
}

void FormCache::clear()
{
    cache_.clear();
    expansions_ = 0;
}

} // namespace pdfdraw
