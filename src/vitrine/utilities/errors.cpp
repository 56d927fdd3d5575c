#include <vitrine/utilities/errors.h>

#include <boost/core/demangle.hpp>

namespace vitrine {

string
get_error_summary(std::exception const& e)
{
    string summary = boost::core::demangle(typeid(e).name());
    // Strip the namespace qualification from our own exception types.
    if (summary.rfind("vitrine::", 0) == 0)
        summary = summary.substr(9);
    if (auto const* message = get_error_info<internal_error_message_info>(e))
        summary += ": " + *message;
    else if (!dynamic_cast<boost::exception const*>(&e))
        summary += string(": ") + e.what();
    return summary;
}

} // namespace vitrine
