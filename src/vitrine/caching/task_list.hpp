#ifndef VITRINE_CACHING_TASK_LIST_HPP
#define VITRINE_CACHING_TASK_LIST_HPP

#include <chrono>
#include <vector>

#include <vitrine/caching/cache_key.hpp>

namespace vitrine {

typedef std::chrono::system_clock::time_point timestamp;

// a single artifact to fetch into the cache
struct download_task
{
    cache_key key;
    // the URL to fetch the artifact from (typically a time-limited URL issued
    // by the blob store)
    string source_url;
    // when :source_url stops working, if known
    optional<timestamp> expires_hint;
};

bool
operator==(download_task const& a, download_task const& b);

std::ostream&
operator<<(std::ostream& stream, download_task const& task);

// Tasks in a batch are processed in order.
typedef std::vector<download_task> task_list;

// Construct a download task, validating its key.
// (This throws invalid_cache_key if the key components are invalid.)
download_task
make_download_task(
    string entity_id,
    string folder,
    string filename,
    string url,
    optional<timestamp> expires_hint = none);

// Construct the task that fetches the metadata sidecar of an entity.
download_task
make_sidecar_task(
    string entity_id, string url, optional<timestamp> expires_hint = none);

// Parse a task list from JSON text. The text must be an array of objects
// with string fields "entity_id", "folder", "filename" and "url" and an
// optional integer field "expires_at" (seconds since the epoch).
// Malformed text throws parsing_error. Invalid keys throw invalid_cache_key.
task_list
parse_task_list_json(string const& text);

// Get the distinct entity IDs targeted by a task list.
std::vector<string>
get_task_entity_ids(task_list const& tasks);

} // namespace vitrine

#endif
