#ifndef VITRINE_CACHING_MEMORY_STORE_HPP
#define VITRINE_CACHING_MEMORY_STORE_HPP

#include <functional>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include <vitrine/caching/cache_key.hpp>

namespace vitrine {

// The memory store is the in-memory level of the image cache. It holds the
// contents of artifacts that have been read from disk and the parsed metadata
// sidecars of entities.
//
// The memory store is NOT internally synchronized. It's meant to be owned by
// something that guards it with a mutex (i.e., the image cache).
struct memory_store
{
    optional<blob>
    find(cache_key const& key) const;

    void
    insert(cache_key const& key, blob contents);

    optional<nlohmann::json>
    find_metadata(string const& entity_id) const;

    void
    insert_metadata(string const& entity_id, nlohmann::json metadata);

    // Remove everything associated with an entity.
    // Returns the number of entries removed.
    size_t
    remove_entity(string const& entity_id);

    // Remove everything associated with entities for which :should_remove
    // returns true. Returns the number of entries removed.
    size_t
    remove_entities_if(std::function<bool(string const&)> const& should_remove);

    void
    clear();

    // the total number of entries (artifacts and metadata documents)
    size_t
    size() const;

    bool
    empty() const
    {
        return size() == 0;
    }

 private:
    std::unordered_map<cache_key, blob> artifacts_;
    std::unordered_map<string, nlohmann::json> metadata_;
};

} // namespace vitrine

#endif
