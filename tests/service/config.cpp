#include <vitrine/service/config.hpp>

#include <vitrine/fs/file_io.h>
#include <vitrine/utilities/testing.h>

using namespace vitrine;

TEST_CASE("config parsing", "[service][config]")
{
    auto config = parse_cache_config(
        R"({
            "directory": "/var/cache/shop/images",
            "stop_timeout_ms": 500,
            "connect_timeout_s": 5,
            "low_speed_timeout_s": 20,
            "cacert_path": "/etc/ssl/bundle.pem",
            "log_level": "debug",
            "theme": "dark"
        })");
    cache_config expected;
    expected.directory = "/var/cache/shop/images";
    expected.stop_timeout_ms = 500;
    expected.connect_timeout_s = 5;
    expected.low_speed_timeout_s = 20;
    expected.cacert_path = "/etc/ssl/bundle.pem";
    expected.log_level = "debug";
    REQUIRE(config == expected);

    REQUIRE(get_cache_directory(config) == "/var/cache/shop/images");
    REQUIRE(get_stop_timeout_ms(config) == 500);
    auto options = get_http_connection_options(config);
    REQUIRE(options.cacert_path == some(file_path("/etc/ssl/bundle.pem")));
    REQUIRE(options.connect_timeout == some(integer(5)));
    REQUIRE(options.low_speed_timeout == some(integer(20)));
}

TEST_CASE("config defaults", "[service][config]")
{
    auto config = parse_cache_config(R"({"directory": null})");
    REQUIRE(config == cache_config());

    REQUIRE(get_stop_timeout_ms(config) == default_stop_timeout_ms);
    auto options = get_http_connection_options(config);
    REQUIRE(!options.cacert_path);
    REQUIRE(options.connect_timeout == some(default_connect_timeout_s));
    REQUIRE(options.low_speed_timeout == some(default_low_speed_timeout_s));
    REQUIRE(get_cache_directory(config).filename() == "images");
}

TEST_CASE("invalid configs", "[service][config]")
{
    REQUIRE_THROWS_AS(parse_cache_config("{"), config_file_error);
    REQUIRE_THROWS_AS(parse_cache_config("[1, 2]"), config_file_error);
    REQUIRE_THROWS_AS(
        parse_cache_config(R"({"directory": 12})"), config_file_error);
    REQUIRE_THROWS_AS(
        parse_cache_config(R"({"stop_timeout_ms": "soon"})"),
        config_file_error);
    REQUIRE_THROWS_AS(
        parse_cache_config(R"({"connect_timeout_s": 0})"), config_file_error);
    REQUIRE_THROWS_AS(
        parse_cache_config(R"({"low_speed_timeout_s": -4})"),
        config_file_error);
}

TEST_CASE("config files", "[service][config]")
{
    auto dir = reset_test_directory("config_files");

    dump_string_to_file(dir / "good.json", R"({"stop_timeout_ms": 250})");
    REQUIRE(get_stop_timeout_ms(read_cache_config(dir / "good.json")) == 250);

    dump_string_to_file(dir / "bad.json", R"({"stop_timeout_ms": true})");
    try
    {
        read_cache_config(dir / "bad.json");
        FAIL("no exception thrown");
    }
    catch (config_file_error& e)
    {
        REQUIRE(get_required_error_info<file_path_info>(e) == dir / "bad.json");
    }

    try
    {
        read_cache_config(dir / "missing.json");
        FAIL("no exception thrown");
    }
    catch (config_file_error& e)
    {
        REQUIRE(
            get_required_error_info<file_path_info>(e)
            == dir / "missing.json");
    }
}
