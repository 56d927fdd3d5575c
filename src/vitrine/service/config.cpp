#include <vitrine/service/config.hpp>

#include <nlohmann/json.hpp>

#include <vitrine/fs/app_dirs.hpp>
#include <vitrine/fs/file_io.h>
#include <vitrine/utilities/errors.h>

namespace vitrine {

bool
operator==(cache_config const& a, cache_config const& b)
{
    return a.directory == b.directory && a.stop_timeout_ms == b.stop_timeout_ms
           && a.connect_timeout_s == b.connect_timeout_s
           && a.low_speed_timeout_s == b.low_speed_timeout_s
           && a.cacert_path == b.cacert_path && a.log_level == b.log_level;
}

template<class Value>
static void
read_optional_field(
    optional<Value>* value, nlohmann::json const& object, char const* name)
{
    auto field = object.find(name);
    if (field == object.end() || field->is_null())
        return;
    try
    {
        *value = field->get<Value>();
    }
    catch (nlohmann::json::type_error&)
    {
        VITRINE_THROW(
            config_file_error() << internal_error_message_info(
                string("config field has the wrong type: ") + name));
    }
}

static void
check_positive(optional<integer> const& value, char const* name)
{
    if (value && *value <= 0)
    {
        VITRINE_THROW(
            config_file_error() << internal_error_message_info(
                string("config field must be positive: ") + name));
    }
}

cache_config
parse_cache_config(string const& json_text)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(json_text);
    }
    catch (nlohmann::json::parse_error& e)
    {
        VITRINE_THROW(
            config_file_error() << internal_error_message_info(e.what()));
    }
    if (!document.is_object())
    {
        VITRINE_THROW(
            config_file_error()
            << internal_error_message_info("config is not a JSON object"));
    }

    cache_config config;
    read_optional_field(&config.directory, document, "directory");
    read_optional_field(&config.stop_timeout_ms, document, "stop_timeout_ms");
    read_optional_field(
        &config.connect_timeout_s, document, "connect_timeout_s");
    read_optional_field(
        &config.low_speed_timeout_s, document, "low_speed_timeout_s");
    read_optional_field(&config.cacert_path, document, "cacert_path");
    read_optional_field(&config.log_level, document, "log_level");

    check_positive(config.stop_timeout_ms, "stop_timeout_ms");
    check_positive(config.connect_timeout_s, "connect_timeout_s");
    check_positive(config.low_speed_timeout_s, "low_speed_timeout_s");

    return config;
}

cache_config
read_cache_config(file_path const& path)
{
    string text;
    try
    {
        text = read_file_contents(path);
    }
    catch (open_file_error&)
    {
        VITRINE_THROW(
            config_file_error()
            << file_path_info(path)
            << internal_error_message_info("unable to open config file"));
    }
    try
    {
        return parse_cache_config(text);
    }
    catch (config_file_error& e)
    {
        e << file_path_info(path);
        throw;
    }
}

optional<file_path>
find_default_config_file()
{
    return search_in_path(get_config_search_path("vitrine"), "config.json");
}

file_path
get_cache_directory(cache_config const& config)
{
    if (config.directory)
        return file_path(*config.directory);
    return get_user_cache_dir("vitrine") / "images";
}

int
get_stop_timeout_ms(cache_config const& config)
{
    return int(config.stop_timeout_ms.value_or(default_stop_timeout_ms));
}

http_connection_options
get_http_connection_options(cache_config const& config)
{
    http_connection_options options;
    if (config.cacert_path)
        options.cacert_path = file_path(*config.cacert_path);
    options.connect_timeout
        = config.connect_timeout_s.value_or(default_connect_timeout_s);
    options.low_speed_timeout
        = config.low_speed_timeout_s.value_or(default_low_speed_timeout_s);
    return options;
}

} // namespace vitrine
