// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <pdfdraw/obj.hh>

namespace pdfdraw {

static const char* objTypeNames [] = {
    "null",
    "boolean",
    "integer",
    "real",
    "string",
    "name",
    "array",
    "dictionary"
};

obj_t::obj_t (array_t arg)
    : var_ (std::make_shared< array_t > (std::move (arg)))
{ }

obj_t::obj_t (dict_t arg)
    : var_ (std::make_shared< dict_t > (std::move (arg)))
{ }

const char* obj_t::getTypeName () const {
    return objTypeNames [var_.index ()];
}

const obj_t& obj_t::operator[] (size_t n) const {
    return as_array ().at (n);
}

const obj_t& obj_t::get (const char* key) const {
    static const obj_t null;

    auto& dict = as_dict ();
    auto iter = dict.find (key);

    return iter == dict.end () ? null : iter->second;
}

int int_value (const dict_t& dict, const char* key, int def) {
    auto iter = dict.find (key);
    return iter == dict.end () || !iter->second.is_num ()
        ? def : int (iter->second.as_num ());
}

double num_value (const dict_t& dict, const char* key, double def) {
    auto iter = dict.find (key);
    return iter == dict.end () || !iter->second.is_num ()
        ? def : iter->second.as_num ();
}

bool bool_value (const dict_t& dict, const char* key, bool def) {
    auto iter = dict.find (key);
    return iter == dict.end () || !iter->second.is_bool ()
        ? def : iter->second.as_bool ();
}

std::ostream& operator<< (std::ostream& ss, const obj_t& obj) {
    if (obj.is_null ()) {
        ss << "null";
    }
    else if (obj.is_bool ()) {
        ss << (obj.as_bool () ? "true" : "false");
    }
    else if (obj.is_num ()) {
        ss << obj.as_num ();
    }
    else if (obj.is_string ()) {
        ss << "(" << obj.as_string () << ")";
    }
    else if (obj.is_name ()) {
        ss << "/" << obj.as_name ();
    }
    else if (obj.is_array ()) {
        ss << "[";

        const char* sep = "";
        for (auto& x : obj.as_array ()) {
            ss << sep << x;
            sep = " ";
        }

        ss << "]";
    }
    else {
        ss << "<<";

        for (auto& [key, value] : obj.as_dict ()) {
            ss << " /" << key << " " << value;
        }

        ss << " >>";
    }

    return ss;
}

} // namespace pdfdraw
