#ifndef VITRINE_BACKGROUND_BATCH_DOWNLOADER_H
#define VITRINE_BACKGROUND_BATCH_DOWNLOADER_H

#include <functional>
#include <memory>
#include <ostream>

#include <vitrine/caching/disk_store.hpp>
#include <vitrine/caching/page_scope.hpp>
#include <vitrine/caching/task_list.hpp>
#include <vitrine/core.h>
#include <vitrine/io/http_requests.hpp>

namespace vitrine {

// The batch downloader fetches a list of artifacts into a disk store on a
// background thread. Tasks are processed strictly in order, one at a time, so
// progress notifications arrive in task order.
//
// Only one batch runs at a time. Starting a new batch supersedes the current
// one: the current one is asked to stop, and if it doesn't stop within the
// stop timeout, it's abandoned (its thread is detached and no further
// callbacks are started; it exits the next time it checks for cancellation).
// A callback that's already running when its batch is abandoned isn't waited
// for.

enum class batch_state
{
    IDLE,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELED
};

char const*
get_batch_state_name(batch_state state);

std::ostream&
operator<<(std::ostream& stream, batch_state state);

struct batch_status
{
    batch_state state = batch_state::IDLE;
    // the number of tasks processed so far (including failures)
    integer done = 0;
    // the number of tasks in the batch
    integer total = 0;
    // the number of tasks that failed
    integer failed = 0;
    // the progress of the current transfer, if known
    optional<float> item_progress;
};

// All callbacks are invoked on the worker thread. They may call stop() (or
// query the downloader), but they must not start, cancel_and_wait() or shut
// down the downloader. Exceptions thrown by callbacks are logged and
// otherwise ignored.
//
// Any of these may be left empty.
struct batch_callbacks
{
    // called after each task is processed with the number of tasks processed
    // so far and the total number of tasks
    std::function<void(integer done, integer total)> on_progress;

    // called once all tasks have been processed (unless the batch was
    // canceled)
    std::function<void()> on_done;

    // called if the batch as a whole fails (e.g., the disk is full)
    std::function<void(string const& message)> on_error;

    // called when a transfer begins (but not for tasks already on disk)
    std::function<void(cache_key const& key)> on_item_started;

    // called when an artifact is on disk, either because it was just
    // downloaded or because it was already there
    std::function<void(
        cache_key const& key, file_path const& path, integer size)>
        on_item_available;

    // called when an individual task fails
    std::function<void(cache_key const& key, string const& message)>
        on_item_failed;

    // called when a started transfer is cut short (because the batch was
    // canceled or failed as a whole) - Nothing is stored for :key.
    std::function<void(cache_key const& key)> on_item_aborted;
};

// This is thrown internally (from check-ins) when a batch is canceled.
VITRINE_DEFINE_EXCEPTION(batch_canceled)

struct batch_downloader_impl;

struct batch_downloader : noncopyable
{
    // :stop_timeout_ms is how long to wait for a superseded (or shut down)
    // batch to stop before abandoning it.
    batch_downloader(
        std::shared_ptr<disk_store const> store,
        http_connection_factory connection_factory,
        int stop_timeout_ms = 3000);

    // The destructor shuts down the downloader.
    ~batch_downloader();

    // Start downloading :tasks, superseding any batch that's already running.
    // Returns false if the batch couldn't be started, which happens if the
    // downloader has been shut down, if the worker thread can't be created,
    // or if this is called from within a batch callback.
    bool
    start(task_list tasks, batch_callbacks callbacks);

    // Request cancellation of the running batch (if any). This doesn't wait
    // for the batch to actually stop. It's safe to call from any thread,
    // including from within a batch callback.
    void
    stop();

    // Request cancellation of the running batch (if any) and wait (up to the
    // stop timeout) for it to stop. If it doesn't stop in time, it's
    // abandoned. Returns true iff the batch actually stopped (or there was
    // none).
    bool
    cancel_and_wait();

    bool
    is_running() const;

    // Get the status of the most recently started batch.
    batch_status
    status() const;

    // Get the IDs of the entities targeted by the running batch.
    // (This is empty if no batch is running.)
    entity_id_set
    active_entity_ids() const;

    // Cancel any running batch (as with cancel_and_wait()) and refuse to start
    // any more. It's OK to call this more than once.
    void
    shutdown();

    bool
    is_shut_down() const;

 private:
    std::unique_ptr<batch_downloader_impl> impl_;
};

} // namespace vitrine

#endif
