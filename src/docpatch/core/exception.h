#ifndef DOCPATCH_CORE_EXCEPTION_H
#define DOCPATCH_CORE_EXCEPTION_H

#include <docpatch/core/type_definitions.h>

#include <boost/exception/all.hpp>
#include <boost/stacktrace.hpp>

namespace docpatch {

// The following macros are simple wrappers around Boost.Exception to codify
// how that library should be used within docpatch.

#define DOCPATCH_DEFINE_EXCEPTION(id)                                         \
    struct id : virtual boost::exception, virtual std::exception              \
    {                                                                         \
        char const*                                                           \
        what() const noexcept                                                 \
        {                                                                     \
            return boost::diagnostic_information_what(*this);                 \
        }                                                                     \
    };

#define DOCPATCH_DEFINE_ERROR_INFO(T, id)                                     \
    typedef boost::error_info<struct id##_info_tag, T> id##_info;

DOCPATCH_DEFINE_ERROR_INFO(boost::stacktrace::stacktrace, stacktrace)

#define DOCPATCH_THROW(x)                                                     \
    BOOST_THROW_EXCEPTION(                                                    \
        (x) << stacktrace_info(boost::stacktrace::stacktrace()))

using boost::get_error_info;

// get_required_error_info is just like get_error_info except that it requires
// the info to be present and returns a const reference to it. If the info is
// missing, it throws its own exception.
DOCPATCH_DEFINE_EXCEPTION(missing_error_info)
DOCPATCH_DEFINE_ERROR_INFO(string, error_info_id)
DOCPATCH_DEFINE_ERROR_INFO(string, wrapped_exception_diagnostics)
template<class ErrorInfo, class Exception>
typename ErrorInfo::error_info::value_type const&
get_required_error_info(Exception const& e)
{
    typename ErrorInfo::error_info::value_type const* info
        = get_error_info<ErrorInfo>(e);
    if (!info)
    {
        DOCPATCH_THROW(
            missing_error_info()
            << error_info_id_info(typeid(ErrorInfo).name())
            << wrapped_exception_diagnostics_info(
                   boost::diagnostic_information(e)));
    }
    return *info;
}

// A human-readable description of a failure, for errors whose details don't
// fit neatly into structured info.
DOCPATCH_DEFINE_ERROR_INFO(string, error_message)

// ENUMS

// Thrown when an enum holds a value outside its declared range.
DOCPATCH_DEFINE_EXCEPTION(invalid_enum_value)
DOCPATCH_DEFINE_ERROR_INFO(string, enum_id)
DOCPATCH_DEFINE_ERROR_INFO(int, enum_value)

// Thrown when a string doesn't name any value of an enum.
DOCPATCH_DEFINE_EXCEPTION(invalid_enum_string)
DOCPATCH_DEFINE_ERROR_INFO(string, enum_string)

} // namespace docpatch

#endif
