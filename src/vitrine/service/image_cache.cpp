#include <vitrine/service/image_cache.h>

#include <mutex>
#include <unordered_map>

#include <vitrine/caching/memory_store.hpp>
#include <vitrine/core/logging.hpp>
#include <vitrine/utilities/errors.h>
#include <vitrine/utilities/text.h>

namespace vitrine {

// everything that the cache mutex protects - This is shared with the
// tracking callbacks of batches, since an abandoned batch may still be
// running one of them after the cache is gone.
struct cache_state
{
    // No disk I/O is done while holding this.
    std::mutex mutex;

    memory_store memory;

    std::unordered_map<cache_key, cache_entry> entries;

    // the keys that are DOWNLOADING, each with the batch that started it
    std::unordered_map<cache_key, uint64_t> downloading;

    page_scope scope;

    // This is incremented by every eviction. A lookup that reads from disk
    // only promotes what it read if no eviction happened in the meantime.
    uint64_t eviction_generation = 0;

    // This identifies the most recently started batch.
    uint64_t batch_generation = 0;

    bool shut_down = false;
};

struct product_image_cache_impl
{
    std::shared_ptr<disk_store> store;
    std::unique_ptr<batch_downloader> downloader;
    std::shared_ptr<cache_state> state = std::make_shared<cache_state>();
};

static void
initialize_cache(
    product_image_cache_impl& impl,
    cache_config const& config,
    http_connection_factory connection_factory)
{
    impl.store = std::make_shared<disk_store>(get_cache_directory(config));
    impl.downloader = std::make_unique<batch_downloader>(
        impl.store,
        std::move(connection_factory),
        get_stop_timeout_ms(config));
    get_logger()->info(
        "image cache initialized at {}", impl.store->root().string());
}

product_image_cache::product_image_cache(cache_config const& config)
    : impl_(new product_image_cache_impl)
{
    initialize_cache(
        *impl_,
        config,
        make_http_connection_factory(get_http_connection_options(config)));
}

product_image_cache::product_image_cache(
    cache_config const& config, http_connection_factory connection_factory)
    : impl_(new product_image_cache_impl)
{
    initialize_cache(*impl_, config, std::move(connection_factory));
}

product_image_cache::~product_image_cache()
{
    shutdown();
}

file_path const&
product_image_cache::directory() const
{
    return impl_->store->root();
}

// Record a state change for an entry. The caller must hold the cache mutex.
static cache_entry&
update_entry(cache_state& state, cache_key const& key, entry_state new_state)
{
    auto [i, inserted] = state.entries.try_emplace(key);
    auto& entry = i->second;
    if (inserted)
    {
        entry.key = key;
    }
    else if (
        entry.state != new_state
        && !is_legal_transition(entry.state, new_state))
    {
        get_logger()->debug(
            "unexpected state change for {}: {} -> {}",
            lexical_cast<string>(key),
            get_entry_state_name(entry.state),
            get_entry_state_name(new_state));
    }
    entry.state = new_state;
    return entry;
}

static void
record_cached(
    cache_state& state,
    cache_key const& key,
    file_path const& path,
    integer size)
{
    auto& entry = update_entry(state, key, entry_state::CACHED);
    entry.disk_path = path;
    entry.size_bytes = size;
    state.downloading.erase(key);
}

// Return a DOWNLOADING entry to MISSING. The caller must hold the cache
// mutex.
static void
record_interrupted(cache_state& state, cache_key const& key)
{
    state.downloading.erase(key);
    auto i = state.entries.find(key);
    if (i == state.entries.end() || i->second.state != entry_state::DOWNLOADING)
        return;
    update_entry(state, key, entry_state::MISSING);
    i->second.disk_path = none;
    i->second.size_bytes = none;
}

// Return the entries that earlier batches left DOWNLOADING to MISSING.
// (A batch that's abandoned never reports what happened to its current
// transfer.) The caller must hold the cache mutex.
static void
reset_stale_downloads(cache_state& state)
{
    std::vector<cache_key> stale;
    for (auto const& [key, batch] : state.downloading)
    {
        if (batch != state.batch_generation)
            stale.push_back(key);
    }
    for (auto const& key : stale)
        record_interrupted(state, key);
}

// Wrap the caller's callbacks so that the entry table tracks the progress of
// the batch identified by :batch.
static batch_callbacks
make_tracking_callbacks(
    std::shared_ptr<cache_state> const& state,
    uint64_t batch,
    batch_callbacks callbacks)
{
    batch_callbacks tracking;
    tracking.on_progress = std::move(callbacks.on_progress);
    tracking.on_done = std::move(callbacks.on_done);
    tracking.on_error = std::move(callbacks.on_error);
    tracking.on_item_started =
        [state, batch, on_item_started = std::move(callbacks.on_item_started)](
            cache_key const& key) {
            {
                std::scoped_lock<std::mutex> lock(state->mutex);
                // A batch that has been superseded doesn't get to claim
                // entries.
                if (state->batch_generation == batch)
                {
                    update_entry(*state, key, entry_state::DOWNLOADING);
                    state->downloading[key] = batch;
                }
            }
            if (on_item_started)
                on_item_started(key);
        };
    tracking.on_item_available =
        [state,
         on_item_available = std::move(callbacks.on_item_available)](
            cache_key const& key, file_path const& path, integer size) {
            {
                std::scoped_lock<std::mutex> lock(state->mutex);
                record_cached(*state, key, path, size);
            }
            if (on_item_available)
                on_item_available(key, path, size);
        };
    tracking.on_item_failed =
        [state, on_item_failed = std::move(callbacks.on_item_failed)](
            cache_key const& key, string const& message) {
            {
                std::scoped_lock<std::mutex> lock(state->mutex);
                auto& entry = update_entry(*state, key, entry_state::FAILED);
                entry.disk_path = none;
                entry.size_bytes = none;
                state->downloading.erase(key);
            }
            if (on_item_failed)
                on_item_failed(key, message);
        };
    tracking.on_item_aborted =
        [state, on_item_aborted = std::move(callbacks.on_item_aborted)](
            cache_key const& key) {
            {
                std::scoped_lock<std::mutex> lock(state->mutex);
                record_interrupted(*state, key);
            }
            if (on_item_aborted)
                on_item_aborted(key);
        };
    return tracking;
}

bool
product_image_cache::start_batch(task_list tasks, batch_callbacks callbacks)
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    uint64_t batch;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (state.shut_down)
        {
            get_logger()->warn("refusing to start a batch after shutdown");
            return false;
        }
        for (auto const& task : tasks)
        {
            if (state.entries.find(task.key) == state.entries.end())
                update_entry(state, task.key, entry_state::MISSING);
        }
        batch = ++state.batch_generation;
    }
    bool started = impl.downloader->start(
        std::move(tasks),
        make_tracking_callbacks(impl.state, batch, std::move(callbacks)));
    // The previous batch (if any) has been retired by now.
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        reset_stale_downloads(state);
    }
    return started;
}

void
product_image_cache::stop_batch()
{
    impl_->downloader->stop();
}

batch_status
product_image_cache::get_batch_status() const
{
    return impl_->downloader->status();
}

optional<artifact_handle>
product_image_cache::lookup(cache_key const& key)
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    if (!is_valid_cache_key(key))
    {
        get_logger()->debug(
            "lookup of invalid key: {}", lexical_cast<string>(key));
        return none;
    }
    auto path = impl.store->artifact_path(key);

    uint64_t generation;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (auto contents = state.memory.find(key))
            return artifact_handle{key, path, *contents};
        generation = state.eviction_generation;
    }

    optional<blob> contents;
    try
    {
        contents = impl.store->read(key);
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "failed to read {}: {}",
            lexical_cast<string>(key),
            get_error_summary(e));
        return none;
    }
    if (!contents)
        return none;

    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (generation == state.eviction_generation)
        {
            state.memory.insert(key, *contents);
            record_cached(state, key, path, integer(contents->size));
        }
    }
    return artifact_handle{key, path, *contents};
}

optional<artifact_handle>
product_image_cache::lookup(
    string const& entity_id, string const& folder, string const& filename)
{
    return lookup(cache_key{entity_id, folder, filename});
}

optional<nlohmann::json>
product_image_cache::lookup_companion_metadata(string const& entity_id)
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    cache_key key{entity_id, "", sidecar_filename};
    if (!is_valid_cache_key(key))
        return none;

    uint64_t generation;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (auto metadata = state.memory.find_metadata(entity_id))
            return metadata;
        generation = state.eviction_generation;
    }

    optional<blob> contents;
    try
    {
        contents = impl.store->read(key);
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "failed to read the sidecar of {}: {}",
            entity_id,
            get_error_summary(e));
        return none;
    }
    if (!contents)
        return none;

    nlohmann::json metadata;
    try
    {
        metadata = nlohmann::json::parse(
            contents->data, contents->data + contents->size);
    }
    catch (nlohmann::json::parse_error& e)
    {
        get_logger()->warn(
            "the sidecar of {} isn't valid JSON: {}", entity_id, e.what());
        return none;
    }

    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (generation == state.eviction_generation)
        {
            state.memory.insert_metadata(entity_id, metadata);
            record_cached(
                state,
                key,
                impl.store->sidecar_path(entity_id),
                integer(contents->size));
        }
    }
    return metadata;
}

void
product_image_cache::set_page_scope(entity_id_set ids)
{
    auto& state = *impl_->state;
    get_logger()->debug("page scope set to {} entit(ies)", ids.size());
    std::scoped_lock<std::mutex> lock(state.mutex);
    state.scope.replace(std::move(ids));
}

entity_id_set
product_image_cache::get_page_scope() const
{
    auto& state = *impl_->state;
    std::scoped_lock<std::mutex> lock(state.mutex);
    return state.scope.ids();
}

// Remove the in-memory state of the entities for which :should_evict returns
// true. The caller must hold the cache mutex.
template<class Predicate>
static void
evict_from_memory(cache_state& state, Predicate const& should_evict)
{
    ++state.eviction_generation;
    state.memory.remove_entities_if(should_evict);
    std::erase_if(state.entries, [&](auto const& entry) {
        return should_evict(entry.first.entity_id);
    });
    std::erase_if(state.downloading, [&](auto const& entry) {
        return should_evict(entry.first.entity_id);
    });
}

// Evict the entities in :plan from memory and disk. Returns the number of
// entities whose directories were removed (or were already absent).
static integer
carry_out_eviction(product_image_cache_impl& impl, eviction_plan const& plan)
{
    auto& state = *impl.state;
    auto logger = get_logger();
    for (auto const& id : plan.protected_ids)
        logger->debug("not evicting {}: it's being downloaded", id);

    entity_id_set evicted(plan.to_evict.begin(), plan.to_evict.end());
    auto is_evicted
        = [&](string const& id) { return evicted.find(id) != evicted.end(); };

    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        evict_from_memory(state, is_evicted);
    }

    integer removed = 0;
    for (auto const& id : plan.to_evict)
    {
        try
        {
            impl.store->remove_entity(id);
            ++removed;
        }
        catch (std::exception& e)
        {
            logger->warn("failed to evict {}: {}", id, get_error_summary(e));
        }
    }

    // A lookup may have promoted something from one of these entities while
    // its directory was being removed, so sweep memory again.
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        evict_from_memory(state, is_evicted);
    }

    return removed;
}

integer
product_image_cache::evict_outside_scope()
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    auto in_use = impl.downloader->active_entity_ids();

    std::vector<string> candidates;
    try
    {
        candidates = impl.store->list_entities();
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "failed to list the cache directory: {}", get_error_summary(e));
    }

    eviction_plan plan;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        // Entities that are only in memory are candidates too.
        for (auto const& [key, entry] : state.entries)
            candidates.push_back(key.entity_id);
        plan = plan_eviction(candidates, state.scope, in_use);
    }

    auto removed = carry_out_eviction(impl, plan);

    // Partial files belong to the running batch, if there is one.
    if (!impl.downloader->is_running())
        impl.store->remove_partial_files();

    get_logger()->info(
        "evicted {} entit(ies) outside the page scope ({} in use)",
        removed,
        plan.protected_ids.size());
    return removed;
}

integer
product_image_cache::evict_entities(std::vector<string> const& entity_ids)
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    auto in_use = impl.downloader->active_entity_ids();

    // Only IDs that are safe to use as directory names are considered.
    std::vector<string> candidates;
    for (auto const& id : entity_ids)
    {
        if (is_valid_cache_key(cache_key{id, "", sidecar_filename}))
            candidates.push_back(id);
        else
            get_logger()->warn("not evicting invalid entity ID: {}", id);
    }

    eviction_plan plan;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        plan = plan_eviction(candidates, state.scope, in_use);
    }
    for (auto const& id : plan.in_scope)
        get_logger()->debug("not evicting {}: it's in the page scope", id);

    auto removed = carry_out_eviction(impl, plan);
    get_logger()->info("evicted {} entit(ies)", removed);
    return removed;
}

// Forget everything the cache knows. The caller must hold the cache mutex.
static void
clear_state(cache_state& state)
{
    ++state.eviction_generation;
    // Any batch that's still around (i.e., abandoned) no longer counts.
    ++state.batch_generation;
    state.memory.clear();
    state.entries.clear();
    state.downloading.clear();
}

void
product_image_cache::clear_all()
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    impl.downloader->cancel_and_wait();
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        clear_state(state);
        state.scope.clear();
    }
    try
    {
        impl.store->reset();
    }
    catch (std::exception& e)
    {
        get_logger()->warn(
            "failed to clear the cache directory: {}", get_error_summary(e));
    }
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        clear_state(state);
    }
    get_logger()->info("cache cleared");
}

cache_stats
product_image_cache::stats() const
{
    auto& impl = *impl_;
    cache_stats stats;
    auto summary = impl.store->summarize();
    stats.directory = summary.directory;
    stats.entity_count = summary.entity_count;
    stats.file_count = summary.file_count;
    stats.total_bytes = summary.total_bytes;
    {
        std::scoped_lock<std::mutex> lock(impl.state->mutex);
        stats.memory_entry_count = integer(impl.state->memory.size());
    }
    return stats;
}

stored_artifact_list
product_image_cache::list_entity_artifacts(string const& entity_id) const
{
    if (!is_valid_cache_key(cache_key{entity_id, "", sidecar_filename}))
        return stored_artifact_list();
    return impl_->store->list_entity_artifacts(entity_id);
}

bool
product_image_cache::is_entity_cached(string const& entity_id) const
{
    return !list_entity_artifacts(entity_id).empty();
}

optional<cache_entry>
product_image_cache::entry(cache_key const& key) const
{
    auto& state = *impl_->state;
    std::scoped_lock<std::mutex> lock(state.mutex);
    auto i = state.entries.find(key);
    if (i == state.entries.end())
        return none;
    cache_entry entry = i->second;
    entry.contents = state.memory.find(key);
    return entry;
}

entry_state
product_image_cache::get_entry_state(cache_key const& key) const
{
    auto& state = *impl_->state;
    std::scoped_lock<std::mutex> lock(state.mutex);
    auto i = state.entries.find(key);
    return i == state.entries.end() ? entry_state::MISSING : i->second.state;
}

void
product_image_cache::shutdown()
{
    auto& impl = *impl_;
    auto& state = *impl.state;
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        if (state.shut_down)
            return;
        state.shut_down = true;
    }
    impl.downloader->shutdown();
    // Nothing is in flight anymore.
    {
        std::scoped_lock<std::mutex> lock(state.mutex);
        ++state.batch_generation;
        reset_stale_downloads(state);
    }
    get_logger()->info("image cache shut down");
}

bool
product_image_cache::is_shut_down() const
{
    auto& state = *impl_->state;
    std::scoped_lock<std::mutex> lock(state.mutex);
    return state.shut_down;
}

} // namespace vitrine
