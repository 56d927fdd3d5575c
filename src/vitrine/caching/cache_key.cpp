#include <vitrine/caching/cache_key.hpp>

#include <tuple>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/functional/hash.hpp>

#include <vitrine/utilities/errors.h>

namespace vitrine {

string const sidecar_filename = "meta.json";

string const partial_file_suffix = ".part";

bool
operator==(cache_key const& a, cache_key const& b)
{
    return a.entity_id == b.entity_id && a.folder == b.folder
           && a.filename == b.filename;
}
bool
operator!=(cache_key const& a, cache_key const& b)
{
    return !(a == b);
}
bool
operator<(cache_key const& a, cache_key const& b)
{
    return std::tie(a.entity_id, a.folder, a.filename)
           < std::tie(b.entity_id, b.folder, b.filename);
}

std::ostream&
operator<<(std::ostream& stream, cache_key const& key)
{
    stream << key.entity_id << "/";
    if (!key.folder.empty())
        stream << key.folder << "/";
    stream << key.filename;
    return stream;
}

size_t
hash_value(cache_key const& key)
{
    size_t h = 0;
    boost::hash_combine(h, key.entity_id);
    boost::hash_combine(h, key.folder);
    boost::hash_combine(h, key.filename);
    return h;
}

// Check a single component. Returns an explanation of the problem, if any.
static optional<string>
check_component(string const& component, bool allow_empty)
{
    if (component.empty())
    {
        if (allow_empty)
            return none;
        return string("component is empty");
    }
    if (component.find('/') != string::npos
        || component.find('\\') != string::npos)
    {
        return string("component contains a path separator");
    }
    if (component == "." || component == "..")
        return string("component is a relative directory reference");
    if (component.find('\0') != string::npos)
        return string("component contains a null character");
    return none;
}

static optional<std::pair<string, string>>
find_key_problem(cache_key const& key)
{
    if (auto problem = check_component(key.entity_id, false))
        return std::make_pair(key.entity_id, "entity ID: " + *problem);
    if (auto problem = check_component(key.folder, true))
        return std::make_pair(key.folder, "folder: " + *problem);
    if (auto problem = check_component(key.filename, false))
        return std::make_pair(key.filename, "filename: " + *problem);
    if (boost::algorithm::ends_with(key.filename, partial_file_suffix))
    {
        return std::make_pair(
            key.filename, string("filename: reserved suffix"));
    }
    return none;
}

bool
is_valid_cache_key(cache_key const& key)
{
    return !find_key_problem(key);
}

cache_key
make_cache_key(string entity_id, string folder, string filename)
{
    cache_key key{std::move(entity_id), std::move(folder), std::move(filename)};
    if (auto problem = find_key_problem(key))
    {
        VITRINE_THROW(
            invalid_cache_key()
            << invalid_key_component_info(problem->first)
            << internal_error_message_info(problem->second));
    }
    return key;
}

cache_key
make_sidecar_key(string entity_id)
{
    return make_cache_key(std::move(entity_id), "", sidecar_filename);
}

char const*
get_entry_state_name(entry_state state)
{
    switch (state)
    {
        case entry_state::MISSING:
            return "missing";
        case entry_state::DOWNLOADING:
            return "downloading";
        case entry_state::CACHED:
            return "cached";
        case entry_state::FAILED:
        default:
            return "failed";
    }
}

std::ostream&
operator<<(std::ostream& stream, entry_state state)
{
    return stream << get_entry_state_name(state);
}

bool
is_legal_transition(entry_state from, entry_state to)
{
    switch (from)
    {
        case entry_state::MISSING:
            return to != entry_state::MISSING;
        case entry_state::DOWNLOADING:
            return to != entry_state::DOWNLOADING;
        case entry_state::CACHED:
            return to == entry_state::MISSING;
        case entry_state::FAILED:
        default:
            return to == entry_state::DOWNLOADING
                   || to == entry_state::MISSING;
    }
}

} // namespace vitrine
