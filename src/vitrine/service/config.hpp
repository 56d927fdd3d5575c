#ifndef VITRINE_SERVICE_CONFIG_HPP
#define VITRINE_SERVICE_CONFIG_HPP

#include <vitrine/fs/types.hpp>
#include <vitrine/io/http_requests.hpp>

namespace vitrine {

// configuration for the image cache (and the tool that drives it)
//
// Every field is optional. Defaults are applied by the accessors below.
struct cache_config
{
    // the root directory of the cache -
    // The default is an "images" directory within the user's cache directory
    // for vitrine.
    optional<string> directory;

    // how long (in milliseconds) to wait for a superseded batch to stop
    // before abandoning it
    optional<integer> stop_timeout_ms;

    // the connection timeout for fetches (in seconds)
    optional<integer> connect_timeout_s;

    // Transfers that make no progress for this long (in seconds) are aborted.
    optional<integer> low_speed_timeout_s;

    // a CA certificate bundle to use for TLS
    optional<string> cacert_path;

    // the log level (as a name, e.g., "info")
    optional<string> log_level;
};

bool
operator==(cache_config const& a, cache_config const& b);

integer constexpr default_stop_timeout_ms = 3000;
integer constexpr default_connect_timeout_s = 10;
integer constexpr default_low_speed_timeout_s = 30;

// This exception indicates that a config file couldn't be read or isn't
// valid. It also provides file_path_info (if the config came from a file) and
// internal_error_message_info.
VITRINE_DEFINE_EXCEPTION(config_file_error)

// Parse a config from JSON text. Unrecognized fields are ignored.
cache_config
parse_cache_config(string const& json_text);

// Read a config from a JSON file.
cache_config
read_cache_config(file_path const& path);

// Find the config file in the standard search path for vitrine (if there is
// one).
optional<file_path>
find_default_config_file();

// Get the cache root directory that :config specifies.
file_path
get_cache_directory(cache_config const& config);

int
get_stop_timeout_ms(cache_config const& config);

http_connection_options
get_http_connection_options(cache_config const& config);

} // namespace vitrine

#endif
