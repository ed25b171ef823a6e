#ifndef DOCPATCH_DIFF_CONFIG_H
#define DOCPATCH_DIFF_CONFIG_H

#include <functional>
#include <map>
#include <ostream>
#include <vector>

#include <docpatch/core/dynamic.h>

namespace docpatch {

// how sequences that differ are turned into operations
enum class array_strategy
{
    // $set the whole sequence
    REPLACE,
    // positional $sets or $push where cheap, otherwise REPLACE
    SMART,
    // $push when the old sequence is a prefix of the new one
    APPEND,
    // pair structure elements by identifier
    MERGE
};

std::ostream&
operator<<(std::ostream& s, array_strategy strategy);

// Parse one of "replace", "smart", "append" or "merge".
array_strategy
parse_array_strategy(string const& s);

void
to_dynamic(dynamic* v, array_strategy x);
void
from_dynamic(array_strategy* x, dynamic const& v);

// what happens when a scalar changes to its type's zero value
enum class zero_value_handling
{
    AS_UNSET,
    AS_SET,
    IGNORE
};

std::ostream&
operator<<(std::ostream& s, zero_value_handling handling);

// Parse one of "unset", "set" or "ignore".
zero_value_handling
parse_zero_value_handling(string const& s);

void
to_dynamic(dynamic* v, zero_value_handling x);
void
from_dynamic(zero_value_handling* x, dynamic const& v);

// the result of a custom comparer
struct field_diff
{
    // the operator to record under (e.g., "$set")
    string operation;
    dynamic value;
    // the path to record, or empty for the path being compared
    string path;
};

// A custom comparer receives the old and new values at a path (nil when
// absent) and optionally produces a single operation in place of the regular
// comparison.
typedef std::function<optional<field_diff>(
    dynamic const& old_value, dynamic const& new_value)>
    field_comparer;

struct diff_config
{
    // Fields are ignored if their declared name, their external name or
    // their full path appears here.
    std::vector<string> ignore_fields;

    array_strategy arrays = array_strategy::REPLACE;

    zero_value_handling zero_values = zero_value_handling::AS_SET;

    // Fail if the old and new values share any pointee.
    bool detect_pointer_sharing = false;

    // full path -> comparer
    std::map<string, field_comparer> custom_comparers;
};

// The conversions cover everything but the custom comparers.
// Keys: ignore_fields, array_strategy, zero_value_handling,
// detect_pointer_sharing. Keys that are missing in a dynamic leave the
// corresponding fields at their defaults.
void
to_dynamic(dynamic* v, diff_config const& x);
void
from_dynamic(diff_config* x, dynamic const& v);

} // namespace docpatch

#endif
