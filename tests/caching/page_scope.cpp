#include <vitrine/caching/page_scope.hpp>

#include <vitrine/utilities/testing.h>

using namespace vitrine;

TEST_CASE("page scope replacement", "[caching][page_scope]")
{
    page_scope scope;
    REQUIRE(scope.size() == 0);
    REQUIRE(!scope.contains("p1"));

    scope.replace({"p1", "p2"});
    REQUIRE(scope.contains("p1"));
    REQUIRE(scope.contains("p2"));

    // Replacement is wholesale.
    scope.replace({"p3"});
    REQUIRE(!scope.contains("p1"));
    REQUIRE(scope.ids() == entity_id_set({"p3"}));

    scope.clear();
    REQUIRE(scope.size() == 0);
}

TEST_CASE("eviction planning", "[caching][page_scope]")
{
    page_scope scope;
    scope.replace({"p1", "p2"});

    auto plan
        = plan_eviction({"p1", "p3", "p4", "p3", "p2", "p5"}, scope, {"p4"});
    REQUIRE(plan.to_evict == std::vector<string>({"p3", "p5"}));
    REQUIRE(plan.protected_ids == std::vector<string>({"p4"}));
    REQUIRE(plan.in_scope == std::vector<string>({"p1", "p2"}));

    // An entity that's both in scope and in use is simply in scope.
    plan = plan_eviction({"p1"}, scope, {"p1"});
    REQUIRE(plan.to_evict.empty());
    REQUIRE(plan.in_scope == std::vector<string>({"p1"}));

    // With an empty scope, everything not in use goes.
    plan = plan_eviction({"p1", "p2"}, page_scope(), {});
    REQUIRE(plan.to_evict == std::vector<string>({"p1", "p2"}));
}
