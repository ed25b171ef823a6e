#ifndef DOCPATCH_CORE_DYNAMIC_H
#define DOCPATCH_CORE_DYNAMIC_H

#include <initializer_list>
#include <ostream>

#include <docpatch/core/exception.h>
#include <docpatch/core/type_definitions.h>

namespace docpatch {

using boost::posix_time::ptime;

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
DOCPATCH_DEFINE_EXCEPTION(value_type_mismatch)
DOCPATCH_DEFINE_ERROR_INFO(value_type, expected_value_type)
DOCPATCH_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<ptime>
{
    static value_type const value = value_type::DATETIME;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);

DOCPATCH_DEFINE_EXCEPTION(missing_field)
DOCPATCH_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::get<T>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::get<T>(v.contents());
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

void
swap(dynamic& a, dynamic& b);

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);
bool
operator<(dynamic const& a, dynamic const& b);

// DATETIMES

// Two datetimes are the same instant, treating not-a-date-time as equal to
// itself (which ptime's own comparison doesn't do).
bool
datetimes_equal(ptime const& a, ptime const& b);

// Get the preferred representation for encoding a ptime as a string.
// (This preserves milliseconds.)
string
to_value_string(ptime const& t);

// Parse a string in the format produced by to_value_string.
ptime
parse_ptime(string const& s);

// CONVERSIONS

// The base types and a few standard containers provide to_dynamic(&v, x) and
// from_dynamic(&x, v). Structures reflected for diffing are converted through
// their type_interface instead (see reflection.h).

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

void
to_dynamic(dynamic* v, bool x);
void
from_dynamic(bool* x, dynamic const& v);

void
to_dynamic(dynamic* v, integer x);
void
from_dynamic(integer* x, dynamic const& v);

void
to_dynamic(dynamic* v, double x);
void
from_dynamic(double* x, dynamic const& v);

void
to_dynamic(dynamic* v, string const& x);
void
from_dynamic(string* x, dynamic const& v);

void
to_dynamic(dynamic* v, ptime const& x);
void
from_dynamic(ptime* x, dynamic const& v);

template<class T>
void
to_dynamic(dynamic* v, std::vector<T> const& x)
{
    dynamic_array array;
    array.reserve(x.size());
    for (auto const& i : x)
    {
        dynamic item;
        to_dynamic(&item, i);
        array.push_back(std::move(item));
    }
    *v = std::move(array);
}

// When an error occurs in the processing of a dynamic value, this provides the
// index within the array where the error occurred.
DOCPATCH_DEFINE_ERROR_INFO(integer, dynamic_array_index)

template<class T>
void
from_dynamic(std::vector<T>* x, dynamic const& v)
{
    dynamic_array const& array = cast<dynamic_array>(v);
    size_t n_elements = array.size();
    x->resize(n_elements);
    for (size_t i = 0; i != n_elements; ++i)
    {
        try
        {
            from_dynamic(&(*x)[i], array[i]);
        }
        catch (boost::exception& e)
        {
            e << dynamic_array_index_info(integer(i));
            throw;
        }
    }
}

// All types that provide to_dynamic(&v, x) and from_dynamic(&x, v) get the
// following alternate, often more convenient forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

} // namespace docpatch

#endif
