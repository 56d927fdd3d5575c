#ifndef VITRINE_CACHING_PAGE_SCOPE_HPP
#define VITRINE_CACHING_PAGE_SCOPE_HPP

#include <set>
#include <vector>

#include <vitrine/core.h>

namespace vitrine {

typedef std::set<string> entity_id_set;

// The page scope is the set of entities that are currently visible to the
// user. It's the locality signal for eviction: everything outside of it is
// fair game. It's replaced wholesale each time the user changes pages.
//
// Like the memory store, this isn't internally synchronized.
struct page_scope
{
    void
    replace(entity_id_set ids)
    {
        ids_ = std::move(ids);
    }

    void
    clear()
    {
        ids_.clear();
    }

    bool
    contains(string const& entity_id) const
    {
        return ids_.find(entity_id) != ids_.end();
    }

    entity_id_set const&
    ids() const
    {
        return ids_;
    }

    size_t
    size() const
    {
        return ids_.size();
    }

 private:
    entity_id_set ids_;
};

struct eviction_plan
{
    // entities that should be evicted
    std::vector<string> to_evict;
    // entities that would be evicted but are in use by a running download
    std::vector<string> protected_ids;
    // entities that were requested but are in scope
    std::vector<string> in_scope;
};

// Decide which of :candidates to evict. Candidates in :scope are never
// evicted, and neither are candidates in :in_use.
eviction_plan
plan_eviction(
    std::vector<string> const& candidates,
    page_scope const& scope,
    entity_id_set const& in_use);

} // namespace vitrine

#endif
