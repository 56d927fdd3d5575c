#include <vitrine/caching/task_list.hpp>

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

#include <vitrine/utilities/errors.h>
#include <vitrine/utilities/text.h>

namespace vitrine {

bool
operator==(download_task const& a, download_task const& b)
{
    return a.key == b.key && a.source_url == b.source_url
           && a.expires_hint == b.expires_hint;
}

std::ostream&
operator<<(std::ostream& stream, download_task const& task)
{
    // The query string of a signed URL is a credential, so it's not logged.
    auto query = task.source_url.find('?');
    stream << task.key << " <- "
           << (query == string::npos ? task.source_url
                                     : task.source_url.substr(0, query));
    return stream;
}

download_task
make_download_task(
    string entity_id,
    string folder,
    string filename,
    string url,
    optional<timestamp> expires_hint)
{
    return download_task{
        make_cache_key(
            std::move(entity_id), std::move(folder), std::move(filename)),
        std::move(url),
        expires_hint};
}

download_task
make_sidecar_task(
    string entity_id, string url, optional<timestamp> expires_hint)
{
    return download_task{
        make_sidecar_key(std::move(entity_id)), std::move(url), expires_hint};
}

static string
get_string_field(nlohmann::json const& object, char const* name)
{
    auto field = object.find(name);
    if (field == object.end() || !field->is_string())
    {
        VITRINE_THROW(
            parsing_error()
            << expected_format_info("task object")
            << parsing_error_info(
                   string("missing or non-string field: ") + name));
    }
    return field->get<string>();
}

task_list
parse_task_list_json(string const& text)
{
    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(text);
    }
    catch (nlohmann::json::parse_error& e)
    {
        VITRINE_THROW(
            parsing_error() << expected_format_info("JSON task list")
                            << parsing_error_info(e.what()));
    }
    if (!document.is_array())
    {
        VITRINE_THROW(
            parsing_error() << expected_format_info("JSON task list")
                            << parsing_error_info("top level is not an array"));
    }

    task_list tasks;
    tasks.reserve(document.size());
    for (auto const& item : document)
    {
        if (!item.is_object())
        {
            VITRINE_THROW(
                parsing_error()
                << expected_format_info("task object")
                << parsing_error_info("task list entry is not an object"));
        }
        optional<timestamp> expires_hint;
        auto expires_at = item.find("expires_at");
        if (expires_at != item.end() && !expires_at->is_null())
        {
            if (!expires_at->is_number_integer())
            {
                VITRINE_THROW(
                    parsing_error()
                    << expected_format_info("task object")
                    << parsing_error_info("expires_at is not an integer"));
            }
            expires_hint = timestamp(
                std::chrono::seconds(expires_at->get<integer>()));
        }
        tasks.push_back(make_download_task(
            get_string_field(item, "entity_id"),
            get_string_field(item, "folder"),
            get_string_field(item, "filename"),
            get_string_field(item, "url"),
            expires_hint));
    }
    return tasks;
}

std::vector<string>
get_task_entity_ids(task_list const& tasks)
{
    std::vector<string> ids;
    std::set<string> seen;
    for (auto const& task : tasks)
    {
        if (seen.insert(task.key.entity_id).second)
            ids.push_back(task.key.entity_id);
    }
    return ids;
}

} // namespace vitrine
