#include <vitrine/caching/task_list.hpp>

#include <vitrine/utilities/testing.h>
#include <vitrine/utilities/text.h>

using namespace vitrine;

TEST_CASE("task construction", "[caching][task_list]")
{
    auto task = make_download_task(
        "p1", "detail", "a.jpg", "https://blobs.example.com/a?sig=1");
    REQUIRE(task.key == make_cache_key("p1", "detail", "a.jpg"));
    REQUIRE(task.source_url == "https://blobs.example.com/a?sig=1");
    REQUIRE(!task.expires_hint);

    auto sidecar = make_sidecar_task("p1", "https://blobs.example.com/m");
    REQUIRE(sidecar.key == make_sidecar_key("p1"));

    REQUIRE_THROWS_AS(
        make_download_task("p1", "..", "a.jpg", "https://x"),
        invalid_cache_key);

    // Signatures aren't included when tasks are written out.
    REQUIRE(
        lexical_cast<string>(task)
        == "p1/detail/a.jpg <- https://blobs.example.com/a");
}

TEST_CASE("task list parsing", "[caching][task_list]")
{
    auto tasks = parse_task_list_json(R"(
        [
            {
                "entity_id": "p1",
                "folder": "detail",
                "filename": "a.jpg",
                "url": "https://blobs.example.com/p1/a.jpg"
            },
            {
                "entity_id": "p1",
                "folder": "",
                "filename": "meta.json",
                "url": "https://blobs.example.com/p1/meta.json",
                "expires_at": 1700000000
            },
            {
                "entity_id": "p2",
                "folder": "thumbs",
                "filename": "b.png",
                "url": "file:///tmp/b.png",
                "expires_at": null
            }
        ]
    )");
    REQUIRE(tasks.size() == 3);
    REQUIRE(
        tasks[0]
        == make_download_task(
            "p1", "detail", "a.jpg", "https://blobs.example.com/p1/a.jpg"));
    REQUIRE(tasks[1].key == make_sidecar_key("p1"));
    REQUIRE(
        tasks[1].expires_hint
        == some(timestamp(std::chrono::seconds(1700000000))));
    REQUIRE(tasks[2].key == make_cache_key("p2", "thumbs", "b.png"));
    REQUIRE(!tasks[2].expires_hint);

    REQUIRE(
        get_task_entity_ids(tasks) == std::vector<string>({"p1", "p2"}));

    REQUIRE(parse_task_list_json("[]").empty());
}

TEST_CASE("malformed task lists", "[caching][task_list]")
{
    REQUIRE_THROWS_AS(parse_task_list_json("[{"), parsing_error);
    REQUIRE_THROWS_AS(parse_task_list_json("{}"), parsing_error);
    REQUIRE_THROWS_AS(parse_task_list_json("[1]"), parsing_error);
    REQUIRE_THROWS_AS(
        parse_task_list_json(
            R"([{"entity_id": "p1", "folder": "f", "filename": "a"}])"),
        parsing_error);
    REQUIRE_THROWS_AS(
        parse_task_list_json(
            R"([{"entity_id": "p1", "folder": "f", "filename": "a",
                 "url": "u", "expires_at": "soon"}])"),
        parsing_error);
    REQUIRE_THROWS_AS(
        parse_task_list_json(
            R"([{"entity_id": "p1", "folder": "f/g", "filename": "a",
                 "url": "u"}])"),
        invalid_cache_key);
}
