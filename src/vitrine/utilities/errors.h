#ifndef VITRINE_UTILITIES_ERRORS_H
#define VITRINE_UTILITIES_ERRORS_H

#include <vitrine/core/exception.hpp>

namespace vitrine {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
VITRINE_DEFINE_ERROR_INFO(string, internal_error_message)

// This can be used to flag errors that represent failed checks on conditions
// that should be guaranteed internally.
VITRINE_DEFINE_EXCEPTION(internal_check_failed)

// Get a short, single-line description of an exception that's suitable for
// log messages and error callbacks. (what() includes the full diagnostic
// information, stack trace and all.) If the exception carries an
// internal_error_message_info, that message is included. (For exceptions
// from outside vitrine, what() is included.)
string
get_error_summary(std::exception const& e);

} // namespace vitrine

#endif
