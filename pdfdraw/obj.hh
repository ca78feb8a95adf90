// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFDRAW_PDFDRAW_OBJ_HH
#define PDFDRAW_PDFDRAW_OBJ_HH

#include <defs.hh>

#include <cstring>

#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pdfdraw {

struct null_t { };

struct name_t : std::string {
    name_t () = default;

    name_t (const char* s) : std::string (s) { }
    name_t (const std::string& s) : std::string (s) { }
    name_t (std::string&& s) : std::string (std::move (s)) { }

    using std::string::operator=;
};

struct obj_t;

using array_t = std::vector< obj_t >;
using dict_t  = std::map< std::string, obj_t >;

//
// An operand, as delivered by the content stream tokenizer. Strings hold raw
// bytes; dictionary keys are stored without the leading slash:
//
struct obj_t {
    obj_t () noexcept : var_ (null_t{ }) { }

    obj_t (bool   arg) noexcept : var_ (arg) { }
    obj_t (int    arg) noexcept : var_ (arg) { }
    obj_t (double arg) noexcept : var_ (arg) { }

    obj_t (const char* arg) : var_ (std::string (arg)) { }
    obj_t (const std::string& arg) : var_ (arg) { }

    obj_t (const name_t& arg) : var_ (arg) { }

    obj_t (array_t);
    obj_t (dict_t);

    template< typename T >
    bool is () const {
        return std::holds_alternative< T > (var_);
    }

    bool is_null () const { return is< null_t > (); }
    bool is_bool () const { return is< bool > (); }

    bool is_int  () const { return is< int > (); }
    bool is_real () const { return is< double > (); }
    bool is_num  () const { return is_int () || is_real (); }

    bool is_string () const { return is< std::string > (); }

    bool is_name () const { return is< name_t > (); }
    bool is_name (const char* s) const {
        return is_name () && 0 == strcmp (as_name (), s);
    }

    bool is_array () const { return is< std::shared_ptr< array_t > > (); }
    bool is_dict  () const { return is< std::shared_ptr< dict_t > > (); }

    template< typename T >
    const T& as () const { return std::get< T > (var_); }

    bool   as_bool () const { return as< bool > (); }
    int    as_int  () const { return as< int > (); }
    double as_real () const { return as< double > (); }
    double as_num  () const { return is_int () ? as_int () : as_real (); }

    const std::string& as_string () const { return as< std::string > (); }

    const char* as_name () const { return as< name_t > ().c_str (); }

    const array_t& as_array () const {
        return *as< std::shared_ptr< array_t > > ();
    }

    const dict_t& as_dict () const {
        return *as< std::shared_ptr< dict_t > > ();
    }

    const char* getTypeName () const;

    //
    // Array accessor:
    //
    const obj_t& operator[] (size_t) const;

    //
    // Dict accessor, returns a null object for a missing key:
    //
    const obj_t& get (const char*) const;

private:
    std::variant<
        null_t,                        //  0
        bool,                          //  1
        int,                           //  2
        double,                        //  3
        std::string,                   //  4
        name_t,                        //  5
        std::shared_ptr< array_t >,    //  6
        std::shared_ptr< dict_t >      //  7
    > var_;
};

std::ostream& operator<< (std::ostream&, const obj_t&);

//
// Looks up the first of the given keys present in the dictionary:
//
template< typename ... Keys >
inline const obj_t& lookup (const dict_t& dict, Keys&& ... keys) {
    static const obj_t null;

    const obj_t* p = &null;

    ((p->is_null () && dict.count (keys)
      ? (p = &dict.at (keys), true) : false), ...);

    return *p;
}

//
// Typed reads of a dictionary entry, with a default for a missing or a
// mistyped one:
//
int    int_value  (const dict_t&, const char*, int);
double num_value  (const dict_t&, const char*, double);
bool   bool_value (const dict_t&, const char*, bool);

inline obj_t make_name_obj (const std::string& arg) {
    return obj_t (name_t (arg));
}

//
// A tokenized operation: the operands followed by the operator:
//
struct operation_t {
    std::vector< obj_t > args;
    std::string op;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_OBJ_HH
