#ifndef VITRINE_UTILITIES_TEXT_H
#define VITRINE_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <vitrine/core/exception.hpp>

namespace vitrine {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
VITRINE_DEFINE_EXCEPTION(parsing_error)
VITRINE_DEFINE_ERROR_INFO(string, expected_format)
VITRINE_DEFINE_ERROR_INFO(string, parsed_text)
VITRINE_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace vitrine

#endif
