#include <vitrine/io/http_requests.hpp>

#include <sstream>

#include <vitrine/fs/file_io.h>
#include <vitrine/utilities/testing.h>

using namespace vitrine;

// libcurl is exercised here through file:// URLs so that the tests don't
// depend on the network.

namespace {

struct string_sink : http_body_sink_interface
{
    void
    write(char const* data, std::size_t size) override
    {
        contents.append(data, size);
    }

    string contents;
};

VITRINE_DEFINE_EXCEPTION(test_sink_failure)

struct failing_sink : http_body_sink_interface
{
    void
    write(char const*, std::size_t) override
    {
        VITRINE_THROW(test_sink_failure());
    }
};

VITRINE_DEFINE_EXCEPTION(test_cancellation)

struct canceling_check_in : check_in_interface
{
    void
    operator()() override
    {
        VITRINE_THROW(test_cancellation());
    }
};

string
make_file_url(file_path const& path)
{
    return "file://" + std::filesystem::absolute(path).generic_string();
}

http_request_system&
get_test_http_system()
{
    static http_request_system the_system;
    return the_system;
}

} // namespace

TEST_CASE("request redaction", "[io][http]")
{
    auto request = make_get_request(
        "https://blobs.example.com/p1/a.jpg?X-Signature=secret",
        {{"Authorization", "Bearer xyz"}, {"Accept", "image/*"}});
    auto redacted = redact_request(request);
    REQUIRE(redacted.url == "https://blobs.example.com/p1/a.jpg?[redacted]");
    REQUIRE(redacted.headers.at("Authorization") == "[redacted]");
    REQUIRE(redacted.headers.at("Accept") == "image/*");

    std::ostringstream stream;
    stream << request;
    REQUIRE(stream.str().find("secret") == string::npos);
    REQUIRE(stream.str().find("xyz") == string::npos);
}

TEST_CASE("status codes", "[io][http]")
{
    REQUIRE(is_successful_status(0));
    REQUIRE(is_successful_status(200));
    REQUIRE(is_successful_status(204));
    REQUIRE(!is_successful_status(302));
    REQUIRE(!is_successful_status(403));
    REQUIRE(!is_successful_status(404));
    REQUIRE(!is_successful_status(500));
}

TEST_CASE("file URL request", "[io][http]")
{
    auto dir = reset_test_directory("file_url_request");
    string body(100000, 'x');
    body.replace(0, 6, "header");
    dump_string_to_file(dir / "image.jpg", body);

    http_connection connection(get_test_http_system());
    null_check_in check_in;
    null_progress_reporter reporter;
    string_sink sink;
    auto response = connection.perform_request(
        check_in,
        reporter,
        make_get_request(make_file_url(dir / "image.jpg")),
        sink);
    // file:// URLs have no status code.
    REQUIRE(response.status_code == 0);
    REQUIRE(response.body_size == body.size());
    REQUIRE(sink.contents == body);
}

TEST_CASE("missing file URL", "[io][http]")
{
    auto dir = reset_test_directory("missing_file_url");
    http_connection connection(get_test_http_system());
    null_check_in check_in;
    null_progress_reporter reporter;
    string_sink sink;
    try
    {
        connection.perform_request(
            check_in,
            reporter,
            make_get_request(make_file_url(dir / "missing.jpg")),
            sink);
        FAIL("no exception thrown");
    }
    catch (http_request_failure& e)
    {
        get_required_error_info<attempted_http_request_info>(e);
        get_required_error_info<internal_error_message_info>(e);
    }
    REQUIRE(sink.contents.empty());
}

TEST_CASE("canceled request", "[io][http]")
{
    auto dir = reset_test_directory("canceled_request");
    dump_string_to_file(dir / "image.jpg", string(100000, 'y'));
    http_connection connection(get_test_http_system());
    canceling_check_in check_in;
    null_progress_reporter reporter;
    string_sink sink;
    REQUIRE_THROWS_AS(
        connection.perform_request(
            check_in,
            reporter,
            make_get_request(make_file_url(dir / "image.jpg")),
            sink),
        test_cancellation);
    REQUIRE(sink.contents.empty());
}

TEST_CASE("sink failures propagate", "[io][http]")
{
    auto dir = reset_test_directory("sink_failure");
    dump_string_to_file(dir / "image.jpg", "some bytes");
    http_connection connection(get_test_http_system());
    null_check_in check_in;
    null_progress_reporter reporter;
    failing_sink sink;
    REQUIRE_THROWS_AS(
        connection.perform_request(
            check_in,
            reporter,
            make_get_request(make_file_url(dir / "image.jpg")),
            sink),
        test_sink_failure);
}

TEST_CASE("missing CA certificate bundle", "[io][http]")
{
    http_connection_options options;
    options.cacert_path = file_path("/very/unlikely/path/to/cacert.pem");
    REQUIRE_THROWS_AS(
        http_connection(get_test_http_system(), options), open_file_error);
}

TEST_CASE("connection factory", "[io][http]")
{
    auto dir = reset_test_directory("connection_factory");
    dump_string_to_file(dir / "a.jpg", "abc");
    auto factory = make_http_connection_factory();
    auto connection = factory();
    null_check_in check_in;
    null_progress_reporter reporter;
    string_sink sink;
    connection->perform_request(
        check_in,
        reporter,
        make_get_request(make_file_url(dir / "a.jpg")),
        sink);
    REQUIRE(sink.contents == "abc");
}
