#ifndef DOCPATCH_UTILITIES_ERRORS_H
#define DOCPATCH_UTILITIES_ERRORS_H

#include <docpatch/core/exception.h>

namespace docpatch {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
DOCPATCH_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace docpatch

#endif
