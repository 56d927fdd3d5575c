#ifndef VITRINE_IO_MOCK_HTTP_H
#define VITRINE_IO_MOCK_HTTP_H

#include <mutex>
#include <vector>

#include <vitrine/io/http_requests.hpp>

namespace vitrine {

// the response half of a scripted exchange
struct mock_http_response
{
    int status_code = 200;
    http_header_list headers;
    string body;
    // If this is set, the request fails at the transport level (as if the
    // server were unreachable) with this message.
    optional<string> transport_error;
};

mock_http_response
make_http_200_response(string body);

mock_http_response
make_http_error_response(int status_code);

mock_http_response
make_http_transport_failure(string message);

struct mock_http_exchange
{
    http_request request;
    mock_http_response response;
};

typedef std::vector<mock_http_exchange> mock_http_script;

// A mock_http_session may be shared by connections on different threads.
struct mock_http_session
{
    mock_http_session()
    {
    }

    mock_http_session(mock_http_script script)
    {
        set_script(std::move(script));
    }

    // Set the script of expected exchanges for this mock HTTP session.
    void
    set_script(mock_http_script script);

    // Have all exchanges in the script been executed?
    bool
    is_complete() const;

    // Has the script been executed in order so far?
    bool
    is_in_order() const;

    // How many requests have been received (recognized or not)?
    int
    request_count() const;

    // Bodies are delivered to sinks in chunks of this size (with a check-in
    // before each one).
    void
    set_chunk_size(std::size_t size);

    // Pause for this long before delivering each chunk.
    void
    set_chunk_delay(int milliseconds);

 private:
    friend struct mock_http_connection;

    mutable std::mutex mutex_;

    mock_http_script script_;

    // Has the script been executed in order so far?
    bool in_order_ = true;

    int request_count_ = 0;

    std::size_t chunk_size_ = 8192;

    int chunk_delay_ = 0;
};

struct mock_http_connection : http_connection_interface
{
    mock_http_connection(mock_http_session& session) : session_(session)
    {
    }

    http_response
    perform_request(
        check_in_interface& check_in,
        progress_reporter_interface& reporter,
        http_request const& request,
        http_body_sink_interface& sink) override;

 private:
    mock_http_session& session_;
};

// Get a connection factory that creates connections to :session.
// The session must outlive any connections created by the factory.
http_connection_factory
make_mock_http_connection_factory(mock_http_session& session);

} // namespace vitrine

#endif
