#ifndef DOCPATCH_ENCODINGS_BSON_H
#define DOCPATCH_ENCODINGS_BSON_H

#include <docpatch/core/dynamic.h>

// BSON - the binary document format of MongoDB-style stores

namespace docpatch {

class patch;

// Thrown when a value can't be represented as (or read from) BSON.
DOCPATCH_DEFINE_EXCEPTION(bson_encoding_error)
DOCPATCH_DEFINE_ERROR_INFO(string, bson_key)

// Encode a map with string keys as a BSON document.
byte_vector
value_to_bson(dynamic const& document);

// Decode a BSON document into a map.
// int32 and int64 values are both read as integers.
dynamic
parse_bson_document(uint8_t const* data, size_t size);

static inline dynamic
parse_bson_document(byte_vector const& bson)
{
    return parse_bson_document(bson.data(), bson.size());
}

// Encode the update document of a patch, ready for submission as a partial
// update.
// Throws empty_patch if the patch has no operations.
byte_vector
patch_to_bson(patch const& p);

} // namespace docpatch

#endif
