#ifndef VITRINE_CORE_LOGGING_HPP
#define VITRINE_CORE_LOGGING_HPP

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <vitrine/core/type_definitions.hpp>

namespace vitrine {

// Get the logger that all vitrine code writes to (the spdlog logger named
// "vitrine"). If the application hasn't registered a logger under that name,
// a colored stdout logger is created and registered on first use.
std::shared_ptr<spdlog::logger>
get_logger();

// Parse the name of a log level ("trace", "debug", "info", "warn", "error",
// "critical" or "off"). An unrecognized name throws parsing_error.
spdlog::level::level_enum
parse_log_level(string const& name);

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
    stream << "\n  " << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Create a logger for a function call.
#define VITRINE_LOG_CALL(args)                                                \
    {                                                                         \
        auto logger = ::vitrine::get_logger();                                \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define VITRINE_LOG_ARG(arg)                                                  \
    vitrine::detail::arg_logger<                                              \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace vitrine

#endif
