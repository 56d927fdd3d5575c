#ifndef VITRINE_UTILITIES_ENVIRONMENT_H
#define VITRINE_UTILITIES_ENVIRONMENT_H

#include <vitrine/core.h>

namespace vitrine {

// Get the value of an environment variable.
string
get_environment_variable(string const& name);
// If the variable isn't set, the following exception is thrown.
VITRINE_DEFINE_EXCEPTION(missing_environment_variable)
VITRINE_DEFINE_ERROR_INFO(string, variable_name)

// Get the value of an optional environment variable.
// If the variable isn't set, this simply returns none.
optional<string>
get_optional_environment_variable(string const& name);

// Set the value of an environment variable.
// Setting it to an empty string removes it.
void
set_environment_variable(string const& name, string const& value);

} // namespace vitrine

#endif
