#ifndef DOCPATCH_UTILITIES_TEXT_H
#define DOCPATCH_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <docpatch/core/exception.h>

namespace docpatch {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
DOCPATCH_DEFINE_EXCEPTION(parsing_error)
DOCPATCH_DEFINE_ERROR_INFO(string, expected_format)
DOCPATCH_DEFINE_ERROR_INFO(string, parsed_text)
DOCPATCH_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace docpatch

#endif
