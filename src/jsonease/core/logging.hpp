#ifndef JSONEASE_CORE_LOGGING_HPP
#define JSONEASE_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <jsonease/core/type_interfaces.hpp>

namespace jsonease {

// Get the "jsonease" logger.
// If nothing has registered it yet, this creates one that writes to stdout and
// only reports warnings and errors.
std::shared_ptr<spdlog::logger>
get_logger();

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
    stream << "\n" << dynamic({{arg.name, to_dynamic(arg.value)}});
    return stream;
}

} // namespace detail

// Log a function call (at debug level).
#define JSONEASE_LOG_CALL(args)                                               \
    {                                                                         \
        auto logger = jsonease::get_logger();                                 \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define JSONEASE_LOG_ARG(arg)                                                 \
    jsonease::detail::arg_logger<                                             \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace jsonease

#endif
