#ifndef DOCPATCH_CORE_TYPE_DEFINITIONS_H
#define DOCPATCH_CORE_TYPE_DEFINITIONS_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/core/noncopyable.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace docpatch {

using boost::noncopyable;

using std::string;

using std::optional;
inline constexpr std::nullopt_t none(std::nullopt);

typedef int64_t integer;

typedef std::vector<uint8_t> byte_vector;

// nil_t is a unit type. It has only one possible value, :nil.
// When passed to compute_patch(), it stands for an absent value.
struct nil_t
{
};
static nil_t nil;

static inline bool
operator==(nil_t, nil_t)
{
    return true;
}
static inline bool
operator!=(nil_t, nil_t)
{
    return false;
}
static inline bool
operator<(nil_t, nil_t)
{
    return false;
}

struct dynamic;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    DATETIME, // boost::posix_time::ptime
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
typedef std::map<dynamic, dynamic> dynamic_map;

using dynamic_storage = std::variant<
    nil_t,
    bool,
    integer,
    double,
    string,
    boost::posix_time::ptime,
    dynamic_array,
    dynamic_map>;

// Dynamic values are values whose structure is determined at run-time rather
// than compile time. Every value recorded in a patch is a dynamic, and
// schema-less documents (e.g., parsed JSON) are diffed as dynamics.
struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v) : storage_(v)
    {
    }
    dynamic(bool v) : storage_(v)
    {
    }
    dynamic(integer v) : storage_(v)
    {
    }
    dynamic(int v) : storage_(integer(v))
    {
    }
    dynamic(double v) : storage_(v)
    {
    }
    dynamic(string const& v) : storage_(v)
    {
    }
    dynamic(string&& v) : storage_(std::move(v))
    {
    }
    dynamic(char const* v) : storage_(string(v))
    {
    }
    dynamic(boost::posix_time::ptime const& v) : storage_(v)
    {
    }
    dynamic(dynamic_array const& v) : storage_(v)
    {
    }
    dynamic(dynamic_array&& v) : storage_(std::move(v))
    {
    }
    dynamic(dynamic_map const& v) : storage_(v)
    {
    }
    dynamic(dynamic_map&& v) : storage_(std::move(v))
    {
    }

    // Construct from an initializer list.
    // A list of two-element lists whose first elements are all strings is
    // treated as a map. Anything else is an array.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return value_type(storage_.index());
    }

    // Get the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    dynamic_storage const&
    contents() const&
    {
        return storage_;
    }

    // Get a non-const reference to the contents.
    dynamic_storage&
    contents() &
    {
        return storage_;
    }

    // Get an r-value reference to the contents.
    dynamic_storage&&
    contents() &&
    {
        return std::move(storage_);
    }

 private:
    friend void
    swap(dynamic& a, dynamic& b);

    dynamic_storage storage_;
};

} // namespace docpatch

#endif
