#ifndef VITRINE_IO_HTTP_REQUESTS_HPP
#define VITRINE_IO_HTTP_REQUESTS_HPP

#include <functional>
#include <map>
#include <memory>
#include <ostream>

#include <vitrine/core.h>
#include <vitrine/fs/types.hpp>
#include <vitrine/utilities/errors.h>

// This file defines a low-level facility for streaming the responses of HTTP
// GET requests (or any other URL scheme that libcurl supports) into a caller
// supplied sink.

namespace vitrine {

// HTTP headers are specified as a mapping from field names to values.
typedef std::map<string, string> http_header_list;

struct http_request
{
    string url;
    http_header_list headers;
};

bool
operator==(http_request const& a, http_request const& b);
bool
operator!=(http_request const& a, http_request const& b);

// Requests are written in their redacted form.
std::ostream&
operator<<(std::ostream& stream, http_request const& request);

// Construct a GET request (in a convenient way).
inline http_request
make_get_request(string url, http_header_list headers = http_header_list())
{
    return http_request{std::move(url), std::move(headers)};
}

// Redact an HTTP request so that it's safe to log.
// This hides the Authorization header and the query string of the URL, since
// time-limited fetch URLs carry their signatures there.
http_request
redact_request(http_request request);

struct http_response
{
    // The status code is 0 for URL schemes that don't have one (e.g., file).
    int status_code = 0;
    http_header_list headers;
    // the number of body bytes that were delivered to the sink
    std::size_t body_size = 0;
};

bool
operator==(http_response const& a, http_response const& b);

std::ostream&
operator<<(std::ostream& stream, http_response const& response);

// Is the given status code a success? (Status codes of 0 come from non-HTTP
// URL schemes and are considered successful.)
inline bool
is_successful_status(int status_code)
{
    return status_code == 0 || (status_code >= 200 && status_code <= 299);
}

// The body of a response is delivered to a sink, chunk by chunk, as it
// arrives.
struct http_body_sink_interface
{
    virtual void
    write(char const* data, std::size_t size)
        = 0;
};

// This exception indicates a general failure in the HTTP request
// system (e.g., a failure to initialize).
VITRINE_DEFINE_EXCEPTION(http_request_system_error)

// This exception indicates that a failure occurred in the processing
// of a HTTP request that precluded getting a response from the server
// (e.g., the server couldn't be reached).
VITRINE_DEFINE_EXCEPTION(http_request_failure)
// This exception also provides internal_error_message_info.
VITRINE_DEFINE_ERROR_INFO(http_request, attempted_http_request)

// This exception indicates that an HTTP request was resolved but
// resulted in a status code outside the 2xx range. The response (without its
// body, which is discarded) is included.
VITRINE_DEFINE_EXCEPTION(bad_http_status_code)
// This exception also provides attempted_http_request_info.
VITRINE_DEFINE_ERROR_INFO(http_response, http_response)

// http_request_system provides global initialization and shutdown of the HTTP
// request system. (The underlying initialization is reference counted.) The
// scope of one of these must dominate the scope of all http_connection objects
// that are created with it.
struct http_request_system : noncopyable
{
    http_request_system();
    ~http_request_system();
};

struct http_connection_options
{
    // a CA certificate bundle to use for verifying TLS peers
    // (If this is omitted, the system default is used.)
    optional<file_path> cacert_path;

    // how long to wait for a connection to be established (in seconds)
    optional<integer> connect_timeout;

    // If a transfer averages less than one byte per second for this long (in
    // seconds), it's aborted.
    optional<integer> low_speed_timeout;
};

// http_connection provides a network connection over which HTTP requests can
// be made.
struct http_connection_interface
{
    virtual ~http_connection_interface()
    {
    }

    // Perform an HTTP request and stream its response body into :sink.
    // Since this may take a long time to complete, monitoring is provided.
    // :check_in is called between chunks (and periodically while waiting), so
    // it can abort the transfer by throwing. Accurate progress reporting
    // relies on the web server providing the size of the response.
    // If the response has a non-2xx status code, nothing is written to :sink
    // and bad_http_status_code is thrown.
    virtual http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request,
        http_body_sink_interface& sink)
        = 0;
};

struct http_connection_impl;

struct http_connection : http_connection_interface
{
    http_connection(
        http_request_system& system,
        http_connection_options options = http_connection_options());
    ~http_connection();

    http_connection(http_connection&&);
    http_connection&
    operator=(http_connection&&);

    http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request,
        http_body_sink_interface& sink) override;

 private:
    std::unique_ptr<http_connection_impl> impl_;
};

// A connection factory creates a connection for the exclusive use of one
// thread.
typedef std::function<std::unique_ptr<http_connection_interface>()>
    http_connection_factory;

// Get a factory that creates real (libcurl) connections with the given
// options. All such connections share a process-wide http_request_system.
http_connection_factory
make_http_connection_factory(
    http_connection_options options = http_connection_options());

} // namespace vitrine

#endif
