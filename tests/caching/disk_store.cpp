#include <vitrine/caching/disk_store.hpp>

#include <vitrine/fs/file_io.h>
#include <vitrine/utilities/testing.h>

using namespace vitrine;

namespace {

void
write_artifact(disk_store const& store, cache_key const& key, string contents)
{
    auto writer = store.begin_write(key);
    writer->write(contents.data(), contents.size());
    writer->commit();
}

} // namespace

TEST_CASE("disk store layout", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_layout");
    disk_store store(dir / "cache");
    REQUIRE(exists(dir / "cache"));
    REQUIRE(store.root() == dir / "cache");

    REQUIRE(
        store.artifact_path(make_cache_key("p1", "detail", "a.jpg"))
        == dir / "cache" / "p1" / "detail" / "a.jpg");
    REQUIRE(
        store.artifact_path(make_sidecar_key("p1"))
        == dir / "cache" / "p1" / "meta.json");
    REQUIRE(store.sidecar_path("p1") == dir / "cache" / "p1" / "meta.json");
    REQUIRE(store.entity_directory("p1") == dir / "cache" / "p1");
}

TEST_CASE("disk store writes", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_writes");
    disk_store store(dir);
    auto key = make_cache_key("p1", "detail", "a.jpg");

    REQUIRE(!store.contains(key));
    REQUIRE(!store.read(key));

    {
        auto writer = store.begin_write(key);
        writer->write("abc", 3);
        writer->write("def", 3);
        REQUIRE(writer->bytes_written() == 6);
        // While the write is in progress, only the partial file exists.
        REQUIRE(exists(writer->partial_path()));
        REQUIRE(writer->partial_path() == dir / "p1" / "detail" / "a.jpg.part");
        REQUIRE(!store.contains(key));
        writer->commit();
        REQUIRE(!exists(writer->partial_path()));
    }

    REQUIRE(store.contains(key));
    REQUIRE(store.artifact_size(key) == some(integer(6)));
    auto contents = store.read(key);
    REQUIRE(contents);
    REQUIRE(to_string(*contents) == "abcdef");
}

TEST_CASE("abandoned disk store writes", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_abandoned_writes");
    disk_store store(dir);
    auto key = make_cache_key("p1", "detail", "a.jpg");

    file_path partial_path;
    {
        auto writer = store.begin_write(key);
        writer->write("abc", 3);
        partial_path = writer->partial_path();
        REQUIRE(exists(partial_path));
        // The writer is destroyed without being committed.
    }
    REQUIRE(!exists(partial_path));
    REQUIRE(!store.contains(key));

    {
        auto writer = store.begin_write(key);
        writer->write("abc", 3);
        writer->abandon();
        REQUIRE(!exists(writer->partial_path()));
    }
    REQUIRE(!store.contains(key));
}

TEST_CASE("empty and partial files are misses", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_misses");
    disk_store store(dir);

    auto empty_key = make_cache_key("p1", "detail", "empty.jpg");
    write_artifact(store, empty_key, "");
    REQUIRE(exists(store.artifact_path(empty_key)));
    REQUIRE(!store.contains(empty_key));
    REQUIRE(!store.read(empty_key));

    auto key = make_cache_key("p1", "detail", "a.jpg");
    auto partial = store.artifact_path(key);
    partial += ".part";
    dump_string_to_file(partial, "partial");
    REQUIRE(!store.contains(key));
    REQUIRE(!store.read(key));
    REQUIRE(store.list_entity_artifacts("p1").empty());
}

TEST_CASE("stale partial files are removed", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_stale_partials");
    std::filesystem::create_directories(dir / "p1" / "detail");
    dump_string_to_file(dir / "p1" / "detail" / "a.jpg.part", "partial");
    dump_string_to_file(dir / "p1" / "detail" / "b.jpg", "complete");

    disk_store store(dir);
    REQUIRE(!exists(dir / "p1" / "detail" / "a.jpg.part"));
    REQUIRE(store.contains(make_cache_key("p1", "detail", "b.jpg")));

    dump_string_to_file(dir / "p1" / "detail" / "c.jpg.part", "partial");
    REQUIRE(store.remove_partial_files() == 1);
    REQUIRE(store.remove_partial_files() == 0);
}

TEST_CASE("disk store entity listing", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_listing");
    disk_store store(dir);
    write_artifact(store, make_cache_key("p1", "detail", "b.jpg"), "bb");
    write_artifact(store, make_cache_key("p1", "detail", "a.jpg"), "a");
    write_artifact(store, make_cache_key("p1", "thumbs", "a.png"), "ccc");
    write_artifact(store, make_sidecar_key("p1"), "{}");
    write_artifact(store, make_cache_key("p2", "detail", "a.jpg"), "dddd");

    auto entities = store.list_entities();
    std::ranges::sort(entities);
    REQUIRE(entities == std::vector<string>({"p1", "p2"}));

    auto artifacts = store.list_entity_artifacts("p1");
    REQUIRE(artifacts.size() == 3);
    REQUIRE(artifacts.at("").size() == 1);
    REQUIRE(artifacts.at("")[0].filename == "meta.json");
    REQUIRE(artifacts.at("detail").size() == 2);
    REQUIRE(artifacts.at("detail")[0].filename == "a.jpg");
    REQUIRE(artifacts.at("detail")[0].size == 1);
    REQUIRE(artifacts.at("detail")[1].filename == "b.jpg");
    REQUIRE(
        artifacts.at("detail")[1].path == dir / "p1" / "detail" / "b.jpg");
    REQUIRE(artifacts.at("thumbs")[0].size == 3);

    REQUIRE(store.has_entity_artifacts("p2"));
    REQUIRE(!store.has_entity_artifacts("p3"));
    REQUIRE(store.list_entity_artifacts("p3").empty());
}

TEST_CASE("disk store summary and removal", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_summary");
    disk_store store(dir);

    auto summary = store.summarize();
    REQUIRE(summary.directory == dir);
    REQUIRE(summary.entity_count == 0);
    REQUIRE(summary.file_count == 0);
    REQUIRE(summary.total_bytes == 0);

    write_artifact(store, make_cache_key("p1", "detail", "a.jpg"), "12345");
    write_artifact(store, make_sidecar_key("p1"), "{}");
    write_artifact(store, make_cache_key("p2", "detail", "a.jpg"), "123");
    // Partial files don't count.
    dump_string_to_file(dir / "p2" / "detail" / "b.jpg.part", "xx");

    summary = store.summarize();
    REQUIRE(summary.entity_count == 2);
    REQUIRE(summary.file_count == 3);
    REQUIRE(summary.total_bytes == 10);

    store.remove_entity("p1");
    REQUIRE(!exists(dir / "p1"));
    // Removing something that isn't there is fine.
    store.remove_entity("p1");

    summary = store.summarize();
    REQUIRE(summary.entity_count == 1);
    REQUIRE(summary.file_count == 1);
    REQUIRE(summary.total_bytes == 3);

    store.reset();
    REQUIRE(exists(dir));
    REQUIRE(store.list_entities().empty());
    REQUIRE(store.summarize().file_count == 0);
}

TEST_CASE("disk store write failures", "[caching][disk_store]")
{
    auto dir = reset_test_directory("disk_store_write_failures");
    disk_store store(dir);
    // Occupy the spot where the entity directory would go with a file.
    dump_string_to_file(dir / "p1", "not a directory");
    REQUIRE_THROWS_AS(
        store.begin_write(make_cache_key("p1", "detail", "a.jpg")),
        disk_store_failure);
}
