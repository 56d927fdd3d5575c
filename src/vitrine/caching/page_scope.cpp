#include <vitrine/caching/page_scope.hpp>

namespace vitrine {

eviction_plan
plan_eviction(
    std::vector<string> const& candidates,
    page_scope const& scope,
    entity_id_set const& in_use)
{
    eviction_plan plan;
    std::set<string> seen;
    for (auto const& id : candidates)
    {
        if (!seen.insert(id).second)
            continue;
        if (scope.contains(id))
            plan.in_scope.push_back(id);
        else if (in_use.find(id) != in_use.end())
            plan.protected_ids.push_back(id);
        else
            plan.to_evict.push_back(id);
    }
    return plan;
}

} // namespace vitrine
