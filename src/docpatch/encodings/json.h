#ifndef DOCPATCH_ENCODINGS_JSON_H
#define DOCPATCH_ENCODINGS_JSON_H

#include <docpatch/core/dynamic.h>

// JSON - conversion to and from JSON strings

namespace docpatch {

struct patch_info;

// Parse some JSON text into a dynamic value.
// Strings that are exactly in the format produced by to_value_string() are
// read as datetimes.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
static inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in JSON format.
// If :indent is negative, the output is compact.
string
value_to_json(dynamic const& v, int indent = -1);

// Write the inspection form of a patch (see to_dynamic(patch_info)).
string
patch_info_to_json(patch_info const& info, int indent = 2);

} // namespace docpatch

#endif
