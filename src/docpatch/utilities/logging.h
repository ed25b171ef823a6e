#ifndef DOCPATCH_UTILITIES_LOGGING_H
#define DOCPATCH_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <docpatch/core/dynamic.h>

namespace docpatch {

// Get the library's logger (registered as "docpatch").
// If the host application hasn't registered one, a logger writing to stderr
// is created and registered.
std::shared_ptr<spdlog::logger>
get_logger();

// Ensure the logger exists and set its level.
void
initialize_logging(spdlog::level::level_enum level);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << " " << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Log a function call at debug level.
#define DOCPATCH_LOG_CALL(args)                                               \
    {                                                                         \
        auto logger = docpatch::get_logger();                                 \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define DOCPATCH_LOG_ARG(arg)                                                 \
    docpatch::detail::arg_logger<                                             \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace docpatch

#endif
