#include <vitrine/caching/memory_store.hpp>

#include <vitrine/utilities/testing.h>

using namespace vitrine;

TEST_CASE("memory store artifacts", "[caching][memory_store]")
{
    memory_store store;
    REQUIRE(store.empty());

    auto a = make_cache_key("p1", "detail", "a.jpg");
    auto b = make_cache_key("p2", "detail", "a.jpg");
    REQUIRE(!store.find(a));

    store.insert(a, make_string_blob("aaa"));
    store.insert(b, make_string_blob("bbb"));
    REQUIRE(store.size() == 2);
    REQUIRE(to_string(*store.find(a)) == "aaa");
    REQUIRE(to_string(*store.find(b)) == "bbb");

    // Reinserting replaces the contents.
    store.insert(a, make_string_blob("AAA"));
    REQUIRE(store.size() == 2);
    REQUIRE(to_string(*store.find(a)) == "AAA");
}

TEST_CASE("memory store metadata", "[caching][memory_store]")
{
    memory_store store;
    REQUIRE(!store.find_metadata("p1"));
    store.insert_metadata("p1", nlohmann::json{{"title", "Teapot"}});
    REQUIRE(store.size() == 1);
    auto metadata = store.find_metadata("p1");
    REQUIRE(metadata);
    REQUIRE((*metadata)["title"] == "Teapot");
}

TEST_CASE("memory store removal", "[caching][memory_store]")
{
    memory_store store;
    store.insert(
        make_cache_key("p1", "detail", "a.jpg"), make_string_blob("a"));
    store.insert(
        make_cache_key("p1", "detail", "b.jpg"), make_string_blob("b"));
    store.insert(
        make_cache_key("p2", "detail", "a.jpg"), make_string_blob("c"));
    store.insert(
        make_cache_key("p3", "detail", "a.jpg"), make_string_blob("d"));
    store.insert_metadata("p1", nlohmann::json::object());
    store.insert_metadata("p3", nlohmann::json::object());
    REQUIRE(store.size() == 6);

    REQUIRE(store.remove_entity("p1") == 3);
    REQUIRE(store.size() == 3);
    REQUIRE(!store.find(make_cache_key("p1", "detail", "a.jpg")));
    REQUIRE(!store.find_metadata("p1"));

    REQUIRE(
        store.remove_entities_if([](string const& id) { return id != "p2"; })
        == 2);
    REQUIRE(store.size() == 1);
    REQUIRE(store.find(make_cache_key("p2", "detail", "a.jpg")));

    store.clear();
    REQUIRE(store.empty());
}
