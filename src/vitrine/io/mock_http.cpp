#include <vitrine/io/mock_http.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include <vitrine/utilities/errors.h>

namespace vitrine {

mock_http_response
make_http_200_response(string body)
{
    mock_http_response response;
    response.status_code = 200;
    response.body = std::move(body);
    return response;
}

mock_http_response
make_http_error_response(int status_code)
{
    mock_http_response response;
    response.status_code = status_code;
    response.body = "error";
    return response;
}

mock_http_response
make_http_transport_failure(string message)
{
    mock_http_response response;
    response.status_code = 0;
    response.transport_error = std::move(message);
    return response;
}

void
mock_http_session::set_script(mock_http_script script)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    script_ = std::move(script);
    in_order_ = true;
}

bool
mock_http_session::is_complete() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return script_.empty();
}

bool
mock_http_session::is_in_order() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return in_order_;
}

int
mock_http_session::request_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return request_count_;
}

void
mock_http_session::set_chunk_size(std::size_t size)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    chunk_size_ = (std::max)(size, std::size_t(1));
}

void
mock_http_session::set_chunk_delay(int milliseconds)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    chunk_delay_ = milliseconds;
}

http_response
mock_http_connection::perform_request(
    check_in_interface& check_in,
    progress_reporter_interface& reporter,
    http_request const& request,
    http_body_sink_interface& sink)
{
    mock_http_response scripted;
    std::size_t chunk_size;
    int chunk_delay;
    {
        std::scoped_lock<std::mutex> lock(session_.mutex_);
        ++session_.request_count_;
        auto exchange = std::ranges::find_if(
            session_.script_,
            [&](auto const& exchange) { return exchange.request == request; });
        if (exchange == session_.script_.end())
        {
            VITRINE_THROW(
                internal_check_failed() << internal_error_message_info(
                    "unrecognized mock HTTP request"));
        }
        if (exchange != session_.script_.begin())
            session_.in_order_ = false;
        scripted = std::move(exchange->response);
        session_.script_.erase(exchange);
        chunk_size = session_.chunk_size_;
        chunk_delay = session_.chunk_delay_;
    }

    check_in();

    if (scripted.transport_error)
    {
        VITRINE_THROW(
            http_request_failure()
            << attempted_http_request_info(redact_request(request))
            << internal_error_message_info(*scripted.transport_error));
    }

    http_response response;
    response.status_code = scripted.status_code;
    response.headers = scripted.headers;

    if (!is_successful_status(scripted.status_code))
    {
        VITRINE_THROW(
            bad_http_status_code()
            << attempted_http_request_info(redact_request(request))
            << http_response_info(response));
    }

    std::size_t total = scripted.body.size();
    std::size_t position = 0;
    while (position < total)
    {
        if (chunk_delay > 0)
        {
            std::this_thread::sleep_for(
                std::chrono::milliseconds(chunk_delay));
        }
        check_in();
        std::size_t n = (std::min)(chunk_size, total - position);
        sink.write(scripted.body.data() + position, n);
        position += n;
        reporter(float(position) / float(total));
    }
    check_in();

    response.body_size = total;
    return response;
}

http_connection_factory
make_mock_http_connection_factory(mock_http_session& session)
{
    return [&session]() -> std::unique_ptr<http_connection_interface> {
        return std::make_unique<mock_http_connection>(session);
    };
}

} // namespace vitrine
