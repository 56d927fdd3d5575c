#ifndef VITRINE_SERVICE_IMAGE_CACHE_H
#define VITRINE_SERVICE_IMAGE_CACHE_H

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include <vitrine/background/batch_downloader.h>
#include <vitrine/caching/cache_key.hpp>
#include <vitrine/caching/disk_store.hpp>
#include <vitrine/caching/page_scope.hpp>
#include <vitrine/caching/task_list.hpp>
#include <vitrine/service/config.hpp>

namespace vitrine {

// The product image cache is the public face of vitrine. It combines a disk
// store, a memory store and a batch downloader into a two-level cache of
// per-product artifacts (images and metadata sidecars), with page-scoped
// eviction to keep its footprint proportional to what the user is looking
// at.
//
// All of its operations are safe to call concurrently. None of them throw
// (except the constructors): failures are logged and surface as misses or
// batch callbacks.

// the result of a successful lookup
struct artifact_handle
{
    cache_key key;
    file_path path;
    // the (undecoded) contents of the artifact
    blob contents;
};

struct cache_stats
{
    // the root directory of the cache
    file_path directory;
    integer entity_count = 0;
    integer file_count = 0;
    integer total_bytes = 0;
    integer memory_entry_count = 0;
};

struct product_image_cache_impl;

struct product_image_cache : noncopyable
{
    // Create a cache as described by :config. Artifacts are fetched with
    // libcurl.
    explicit product_image_cache(cache_config const& config);

    // Create a cache that fetches artifacts through connections supplied by
    // :connection_factory.
    product_image_cache(
        cache_config const& config,
        http_connection_factory connection_factory);

    // The destructor shuts the cache down.
    ~product_image_cache();

    file_path const&
    directory() const;

    // Start downloading :tasks in the background, superseding any batch that's
    // already running. Entries are created (in the MISSING state) for any
    // keys that the cache doesn't know about yet.
    // Returns false if the batch couldn't be started.
    bool
    start_batch(task_list tasks, batch_callbacks callbacks = batch_callbacks());

    // Ask the running batch (if any) to stop. This doesn't wait.
    void
    stop_batch();

    batch_status
    get_batch_status() const;

    // Look up an artifact. The memory store is checked first, then the disk
    // store (and artifacts found on disk are promoted into memory).
    // Artifacts that are still being written are misses.
    optional<artifact_handle>
    lookup(cache_key const& key);

    // same, but with the key given as its components (Invalid components
    // produce a miss.)
    optional<artifact_handle>
    lookup(
        string const& entity_id,
        string const& folder,
        string const& filename);

    // Look up the metadata sidecar of an entity. A sidecar that isn't valid
    // JSON is a miss.
    optional<nlohmann::json>
    lookup_companion_metadata(string const& entity_id);

    // Replace the page scope.
    void
    set_page_scope(entity_id_set ids);

    entity_id_set
    get_page_scope() const;

    // Evict everything outside the page scope from memory and disk.
    // Entities that the running batch is downloading are left alone.
    // Returns the number of entity directories removed.
    integer
    evict_outside_scope();

    // Evict specific entities (unless they're in the page scope or being
    // downloaded). Returns the number of entities evicted.
    integer
    evict_entities(std::vector<string> const& entity_ids);

    // Cancel any running batch and delete everything (including the page
    // scope).
    void
    clear_all();

    // Compute fresh statistics about the cache.
    cache_stats
    stats() const;

    // Get the artifacts that are on disk for an entity, grouped by folder.
    stored_artifact_list
    list_entity_artifacts(string const& entity_id) const;

    // Is at least one artifact of :entity_id on disk?
    bool
    is_entity_cached(string const& entity_id) const;

    // Get the cache's record for :key, if it has one.
    optional<cache_entry>
    entry(cache_key const& key) const;

    // Get the state of :key. (Keys that the cache has no record of are
    // MISSING.)
    entry_state
    get_entry_state(cache_key const& key) const;

    // Cancel any running batch and refuse to start more.
    // Lookups and eviction continue to work.
    void
    shutdown();

    bool
    is_shut_down() const;

 private:
    std::unique_ptr<product_image_cache_impl> impl_;
};

} // namespace vitrine

#endif
