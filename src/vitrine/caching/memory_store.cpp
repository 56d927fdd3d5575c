#include <vitrine/caching/memory_store.hpp>

namespace vitrine {

optional<blob>
memory_store::find(cache_key const& key) const
{
    auto i = artifacts_.find(key);
    if (i == artifacts_.end())
        return none;
    return i->second;
}

void
memory_store::insert(cache_key const& key, blob contents)
{
    artifacts_[key] = std::move(contents);
}

optional<nlohmann::json>
memory_store::find_metadata(string const& entity_id) const
{
    auto i = metadata_.find(entity_id);
    if (i == metadata_.end())
        return none;
    return i->second;
}

void
memory_store::insert_metadata(string const& entity_id, nlohmann::json metadata)
{
    metadata_[entity_id] = std::move(metadata);
}

size_t
memory_store::remove_entity(string const& entity_id)
{
    return remove_entities_if(
        [&](string const& id) { return id == entity_id; });
}

size_t
memory_store::remove_entities_if(
    std::function<bool(string const&)> const& should_remove)
{
    size_t removed = std::erase_if(artifacts_, [&](auto const& entry) {
        return should_remove(entry.first.entity_id);
    });
    removed += std::erase_if(metadata_, [&](auto const& entry) {
        return should_remove(entry.first);
    });
    return removed;
}

void
memory_store::clear()
{
    artifacts_.clear();
    metadata_.clear();
}

size_t
memory_store::size() const
{
    return artifacts_.size() + metadata_.size();
}

} // namespace vitrine
