#ifndef VITRINE_UTILITIES_TESTING_H
#define VITRINE_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <boost/optional.hpp>

#include <vitrine/fs/types.hpp>

namespace vitrine {

// Get a scratch directory for a test case. The directory is created (or
// emptied if it already exists) inside the current working directory.
file_path
reset_test_directory(string const& name);

} // namespace vitrine

// Let Catch2 print boost::optional values in assertion messages.
namespace Catch {
template<class T>
struct StringMaker<boost::optional<T>>
{
    static std::string
    convert(boost::optional<T> const& value)
    {
        if (value)
            return ::Catch::Detail::stringify(*value);
        return "none";
    }
};
} // namespace Catch

#endif
