#ifndef VITRINE_CORE_TYPE_DEFINITIONS_HPP
#define VITRINE_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/core/noncopyable.hpp>
#include <boost/optional.hpp>

namespace vitrine {

using std::string;

using boost::none;
using boost::optional;

using boost::noncopyable;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// ownership_holder is meant to express polymorphic ownership of a resource.
// The idea is that the resource may be owned in many different ways, and we
// don't care what way. We only want an object that will provide ownership of
// the resource until it's destructed. We can achieve this by using an any
// object to hold the ownership object.
typedef std::any ownership_holder;

// A blob is an immutable block of bytes whose lifetime is tied to whatever
// is stored in :ownership. Copying a blob is cheap since copies share the
// same ownership.
struct blob
{
    ownership_holder ownership;
    char const* data = nullptr;
    std::size_t size = 0;
};

// Make a blob that holds the contents of a string.
inline blob
make_string_blob(string s)
{
    auto shared = std::make_shared<string>(std::move(s));
    blob b;
    b.data = shared->data();
    b.size = shared->size();
    b.ownership = std::move(shared);
    return b;
}

// Get a copy of the contents of a blob as a string.
inline string
to_string(blob const& b)
{
    return b.data ? string(b.data, b.size) : string();
}

} // namespace vitrine

#endif
