#include <vitrine/io/http_requests.hpp>

#include <exception>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/numeric/conversion/cast.hpp>

#include <curl/curl.h>

#include <vitrine/core/logging.hpp>
#include <vitrine/fs/file_io.h>

namespace vitrine {

bool
operator==(http_request const& a, http_request const& b)
{
    return a.url == b.url && a.headers == b.headers;
}
bool
operator!=(http_request const& a, http_request const& b)
{
    return !(a == b);
}

static std::ostream&
write_headers(std::ostream& stream, http_header_list const& headers)
{
    stream << "{";
    bool first = true;
    for (auto const& header : headers)
    {
        if (!first)
            stream << ", ";
        stream << header.first << ": " << header.second;
        first = false;
    }
    stream << "}";
    return stream;
}

std::ostream&
operator<<(std::ostream& stream, http_request const& request)
{
    auto redacted = redact_request(request);
    stream << "GET " << redacted.url << " ";
    return write_headers(stream, redacted.headers);
}

bool
operator==(http_response const& a, http_response const& b)
{
    return a.status_code == b.status_code && a.headers == b.headers
           && a.body_size == b.body_size;
}

std::ostream&
operator<<(std::ostream& stream, http_response const& response)
{
    stream << "status " << response.status_code << " ("
           << response.body_size << " body bytes) ";
    return write_headers(stream, response.headers);
}

http_request
redact_request(http_request request)
{
    auto authorization_header = request.headers.find("Authorization");
    if (authorization_header != request.headers.end())
        authorization_header->second = "[redacted]";
    auto query = request.url.find('?');
    if (query != string::npos)
        request.url = request.url.substr(0, query) + "?[redacted]";
    return request;
}

http_request_system::http_request_system()
{
    if (curl_global_init(CURL_GLOBAL_ALL))
    {
        VITRINE_THROW(http_request_system_error());
    }
}
http_request_system::~http_request_system()
{
    curl_global_cleanup();
}

struct http_connection_impl
{
    CURL* curl = nullptr;
    http_connection_options options;

    ~http_connection_impl()
    {
        if (curl)
            curl_easy_cleanup(curl);
    }
};

static void
reset_curl_connection(http_connection_impl& connection)
{
    CURL* curl = connection.curl;
    curl_easy_reset(curl);

    // Connections are used from worker threads, so signals are off limits.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Allow requests to be redirected.
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    // Enable SSL verification.
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    if (connection.options.cacert_path)
    {
        auto path = connection.options.cacert_path->string();
        curl_easy_setopt(curl, CURLOPT_CAINFO, path.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    if (connection.options.connect_timeout)
    {
        curl_easy_setopt(
            curl,
            CURLOPT_CONNECTTIMEOUT,
            long(*connection.options.connect_timeout));
    }
    if (connection.options.low_speed_timeout)
    {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(
            curl,
            CURLOPT_LOW_SPEED_TIME,
            long(*connection.options.low_speed_timeout));
    }
}

http_connection::http_connection(
    http_request_system&, http_connection_options options)
    : impl_(new http_connection_impl)
{
    CURL* curl = curl_easy_init();
    if (!curl)
    {
        VITRINE_THROW(http_request_system_error());
    }
    impl_->curl = curl;

    if (options.cacert_path)
    {
        // Confirm that the file actually exists and can be opened.
        // (Curl will silently ignore it if it can't.)
        std::ifstream in;
        open_file(in, *options.cacert_path, std::ios::in | std::ios::binary);
    }
    impl_->options = std::move(options);
}
http_connection::~http_connection()
{
}

http_connection::http_connection(http_connection&&) = default;
http_connection&
http_connection::operator=(http_connection&&)
    = default;

struct receive_transmission_state
{
    CURL* curl = nullptr;
    check_in_interface* check_in = nullptr;
    http_body_sink_interface* sink = nullptr;

    // Once the first chunk of the body arrives, the status code is known.
    // Bodies of unsuccessful responses are dropped rather than written.
    bool status_checked = false;
    bool discarding = false;

    std::size_t bytes_written = 0;

    // an exception thrown by the sink (to be rethrown after the transfer)
    std::exception_ptr sink_error;
};

static size_t
stream_http_response(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    receive_transmission_state& state
        = *reinterpret_cast<receive_transmission_state*>(userdata);
    size_t n_bytes = size * nmemb;

    if (!state.status_checked)
    {
        long status_code = 0;
        curl_easy_getinfo(state.curl, CURLINFO_RESPONSE_CODE, &status_code);
        state.discarding = !is_successful_status(int(status_code));
        state.status_checked = true;
    }
    if (state.discarding)
        return n_bytes;

    // Returning anything other than n_bytes aborts the transfer.
    // Cancellation is picked up again by checking in after the transfer.
    try
    {
        (*state.check_in)();
    }
    catch (...)
    {
        return 0;
    }
    try
    {
        state.sink->write(ptr, n_bytes);
    }
    catch (...)
    {
        state.sink_error = std::current_exception();
        return 0;
    }
    state.bytes_written += n_bytes;
    return n_bytes;
}

static size_t
record_http_headers(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    string& headers = *reinterpret_cast<string*>(userdata);
    size_t n_bytes = size * nmemb;
    headers.append(ptr, n_bytes);
    return n_bytes;
}

struct curl_progress_data
{
    check_in_interface* check_in;
    progress_reporter_interface* reporter;
};

static int
curl_progress_callback(
    void* clientp, double dltotal, double dlnow, double ultotal, double ulnow)
{
    curl_progress_data* data = reinterpret_cast<curl_progress_data*>(clientp);
    try
    {
        (*data->check_in)();
        (*data->reporter)(
            (dltotal + ultotal == 0)
                ? 0.f
                : float((dlnow + ulnow) / (dltotal + ultotal)));
    }
    catch (...)
    {
        return 1;
    }
    return 0;
}

struct scoped_curl_slist
{
    ~scoped_curl_slist()
    {
        curl_slist_free_all(list);
    }
    curl_slist* list;
};

// Parse the raw header text that CURL delivers. With redirects, this contains
// the headers of every response, so only the last block is kept.
static http_header_list
parse_response_headers(string const& text)
{
    http_header_list headers;
    std::istringstream header_text(text);
    string header_line;
    while (std::getline(header_text, header_line))
    {
        if (boost::algorithm::starts_with(header_line, "HTTP/"))
        {
            headers.clear();
            continue;
        }
        auto index = header_line.find(':', 0);
        if (index != string::npos)
        {
            headers[boost::algorithm::trim_copy(header_line.substr(0, index))]
                = boost::algorithm::trim_copy(header_line.substr(index + 1));
        }
    }
    return headers;
}

http_response
http_connection::perform_request(
    check_in_interface& check_in,
    progress_reporter_interface& reporter,
    http_request const& request,
    http_body_sink_interface& sink)
{
    VITRINE_LOG_CALL(<< VITRINE_LOG_ARG(request))

    CURL* curl = impl_->curl;
    reset_curl_connection(*impl_);

    // Set the headers for the request.
    scoped_curl_slist curl_headers;
    curl_headers.list = NULL;
    for (auto const& header : request.headers)
    {
        auto header_string = header.first + ":" + header.second;
        curl_headers.list
            = curl_slist_append(curl_headers.list, header_string.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, curl_headers.list);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    // Set up for streaming the response body.
    receive_transmission_state body_state;
    body_state.curl = curl;
    body_state.check_in = &check_in;
    body_state.sink = &sink;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_http_response);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body_state);

    // Set up for receiving the response headers.
    string header_text;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, record_http_headers);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_text);

    // Set up progress monitoring.
    curl_progress_data progress_data;
    progress_data.check_in = &check_in;
    progress_data.reporter = &reporter;
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_PROGRESSFUNCTION, curl_progress_callback);
    curl_easy_setopt(curl, CURLOPT_PROGRESSDATA, &progress_data);

    // Perform the request.
    CURLcode result = curl_easy_perform(curl);

    // Check in again here because if the job was canceled inside the above
    // call, it will just look like an error. We need the cancellation
    // exception to be rethrown.
    check_in();

    // Errors from the sink take precedence since they're what aborted the
    // transfer.
    if (body_state.sink_error)
        std::rethrow_exception(body_state.sink_error);

    // Check for low-level CURL errors.
    if (result != CURLE_OK)
    {
        VITRINE_THROW(
            http_request_failure()
            << attempted_http_request_info(redact_request(request))
            << internal_error_message_info(curl_easy_strerror(result)));
    }

    // Construct the response.
    http_response response;
    response.headers = parse_response_headers(header_text);
    response.body_size = body_state.bytes_written;
    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    response.status_code = boost::numeric_cast<int>(status_code);

    // Check the status code.
    if (!is_successful_status(response.status_code))
    {
        VITRINE_THROW(
            bad_http_status_code()
            << attempted_http_request_info(redact_request(request))
            << http_response_info(response));
    }

    return response;
}

http_connection_factory
make_http_connection_factory(http_connection_options options)
{
    return [options]() -> std::unique_ptr<http_connection_interface> {
        static http_request_system the_system;
        return std::make_unique<http_connection>(the_system, options);
    };
}

} // namespace vitrine
