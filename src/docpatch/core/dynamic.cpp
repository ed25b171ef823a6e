#include <docpatch/core/dynamic.h>

#include <algorithm>
#include <locale>
#include <sstream>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <fmt/format.h>

#include <docpatch/utilities/text.h>

namespace docpatch {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::DATETIME:
            s << "datetime";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            DOCPATCH_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        DOCPATCH_THROW(
            value_type_mismatch() << expected_value_type_info(expected)
                                  << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[array[0]] = array[1];
        }
        storage_ = std::move(map);
    }
    else
    {
        storage_ = dynamic_array(list);
    }
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.storage_, b.storage_);
}

static void
write_diagnostic_value(std::ostream& os, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default:
            os << "nil";
            break;
        case value_type::BOOLEAN:
            os << (cast<bool>(v) ? "true" : "false");
            break;
        case value_type::INTEGER:
            os << cast<integer>(v);
            break;
        case value_type::FLOAT:
            os << cast<double>(v);
            break;
        case value_type::STRING:
            os << '"' << cast<string>(v) << '"';
            break;
        case value_type::DATETIME:
            os << to_value_string(cast<ptime>(v));
            break;
        case value_type::ARRAY: {
            os << "[";
            bool first = true;
            for (auto const& item : cast<dynamic_array>(v))
            {
                if (!first)
                    os << ", ";
                write_diagnostic_value(os, item);
                first = false;
            }
            os << "]";
            break;
        }
        case value_type::MAP: {
            os << "{";
            bool first = true;
            for (auto const& item : cast<dynamic_map>(v))
            {
                if (!first)
                    os << ", ";
                write_diagnostic_value(os, item.first);
                os << ": ";
                write_diagnostic_value(os, item.second);
                first = false;
            }
            os << "}";
            break;
        }
    }
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    write_diagnostic_value(os, v);
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    if (a.type() == value_type::DATETIME)
        return datetimes_equal(cast<ptime>(a), cast<ptime>(b));
    return a.contents() == b.contents();
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator<(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return a.type() < b.type();
    return a.contents() < b.contents();
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        DOCPATCH_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(dynamic(field));
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

// DATETIMES

bool
datetimes_equal(ptime const& a, ptime const& b)
{
    if (a.is_not_a_date_time() || b.is_not_a_date_time())
        return a.is_not_a_date_time() && b.is_not_a_date_time();
    return a == b;
}

string
to_value_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    if (t.is_special())
        return bt::to_simple_string(t);
    std::ostringstream os;
    os.imbue(std::locale(
        std::locale::classic(), new bt::time_facet("%Y-%m-%dT%H:%M")));
    os << t;
    // Add the seconds and timezone manually.
    os << fmt::format(
        ":{:02d}.{:03d}Z",
        t.time_of_day().seconds(),
        t.time_of_day().total_milliseconds() % 1000);
    return os.str();
}

ptime
parse_ptime(string const& s)
{
    namespace bt = boost::posix_time;
    std::istringstream is(s);
    is.imbue(std::locale(
        std::locale::classic(),
        new bt::time_input_facet("%Y-%m-%dT%H:%M:%s")));
    ptime t;
    is >> t;
    char z = 0;
    is.get(z);
    if (t != ptime() && z == 'Z'
        && is.peek() == std::istringstream::traits_type::eof())
    {
        return t;
    }
    DOCPATCH_THROW(
        parsing_error() << expected_format_info("datetime")
                        << parsed_text_info(s));
}

// CONVERSIONS

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}
void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

void
to_dynamic(dynamic* v, integer x)
{
    *v = x;
}
void
from_dynamic(integer* x, dynamic const& v)
{
    *x = cast<integer>(v);
}

void
to_dynamic(dynamic* v, double x)
{
    *v = x;
}
void
from_dynamic(double* x, dynamic const& v)
{
    // Integers are acceptable wherever floats are expected.
    if (v.type() == value_type::INTEGER)
        *x = double(cast<integer>(v));
    else
        *x = cast<double>(v);
}

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}
void
from_dynamic(string* x, dynamic const& v)
{
    if (v.type() == value_type::DATETIME)
        *x = to_value_string(cast<ptime>(v));
    else
        *x = cast<string>(v);
}

void
to_dynamic(dynamic* v, ptime const& x)
{
    *v = x;
}
void
from_dynamic(ptime* x, dynamic const& v)
{
    if (v.type() == value_type::STRING)
        *x = parse_ptime(cast<string>(v));
    else
        *x = cast<ptime>(v);
}

} // namespace docpatch
