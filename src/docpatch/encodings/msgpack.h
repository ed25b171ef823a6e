#ifndef DOCPATCH_ENCODINGS_MSGPACK_H
#define DOCPATCH_ENCODINGS_MSGPACK_H

#include <docpatch/core/dynamic.h>

// This file provides functions for converting dynamic values (and patches) to
// and from MessagePack.

namespace docpatch {

class patch;

dynamic
parse_msgpack_value(uint8_t const* data, size_t size);

dynamic
parse_msgpack_value(string const& msgpack);

string
value_to_msgpack_string(dynamic const& v);

byte_vector
value_to_msgpack_bytes(dynamic const& v);

// Encode the update document of a patch.
// Throws empty_patch if the patch has no operations.
byte_vector
patch_to_msgpack(patch const& p);

} // namespace docpatch

#endif
