#ifndef VITRINE_CACHING_CACHE_KEY_HPP
#define VITRINE_CACHING_CACHE_KEY_HPP

#include <ostream>

#include <vitrine/core.h>
#include <vitrine/fs/types.hpp>

namespace vitrine {

// A cache key identifies one artifact of one entity (e.g., one image of one
// product). Keys map directly onto the on-disk layout of the cache:
//
//   cache_root/{entity_id}/{folder}/{filename}
//
// An empty folder addresses the entity root directory.
struct cache_key
{
    string entity_id;
    string folder;
    string filename;
};

bool
operator==(cache_key const& a, cache_key const& b);
bool
operator!=(cache_key const& a, cache_key const& b);
bool
operator<(cache_key const& a, cache_key const& b);

std::ostream&
operator<<(std::ostream& stream, cache_key const& key);

size_t
hash_value(cache_key const& key);

// This exception indicates that the components of a cache key can't be
// mapped safely onto the cache directory.
VITRINE_DEFINE_EXCEPTION(invalid_cache_key)
VITRINE_DEFINE_ERROR_INFO(string, invalid_key_component)
// This exception also provides internal_error_message_info.

// Construct a cache key, validating its components.
// :entity_id and :filename must be non-empty. No component may contain a
// path separator or be "." or "..", and :filename must not end in ".part"
// (which is reserved for files that are still being written).
cache_key
make_cache_key(string entity_id, string folder, string filename);

// Is the given key valid? (This is the check that make_cache_key applies.)
bool
is_valid_cache_key(cache_key const& key);

// the name of the metadata sidecar file at the root of each entity directory
extern string const sidecar_filename;

// Get the key of the metadata sidecar for the given entity.
cache_key
make_sidecar_key(string entity_id);

// the suffix that marks a file as partially written
extern string const partial_file_suffix;

enum class entry_state
{
    MISSING,
    DOWNLOADING,
    CACHED,
    FAILED
};

char const*
get_entry_state_name(entry_state state);

std::ostream&
operator<<(std::ostream& stream, entry_state state);

// Is the transition from :from to :to a legal one for a cache entry?
// Transitions are monotonic (MISSING -> DOWNLOADING -> CACHED or FAILED)
// except that FAILED entries may be retried, eviction may return CACHED
// entries to MISSING, and an interrupted transfer returns its entry to
// MISSING.
bool
is_legal_transition(entry_state from, entry_state to);

// the cache's record of an individual artifact
struct cache_entry
{
    cache_key key;
    entry_state state = entry_state::MISSING;
    optional<file_path> disk_path;
    // the artifact contents, if they're currently held in memory
    optional<blob> contents;
    optional<integer> size_bytes;
};

} // namespace vitrine

namespace std {

template<>
struct hash<vitrine::cache_key>
{
    size_t
    operator()(vitrine::cache_key const& key) const
    {
        return vitrine::hash_value(key);
    }
};

} // namespace std

#endif
