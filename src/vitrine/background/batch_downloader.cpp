#include <vitrine/background/batch_downloader.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

#include <vitrine/core/logging.hpp>
#include <vitrine/utilities/errors.h>
#include <vitrine/utilities/text.h>

namespace vitrine {

char const*
get_batch_state_name(batch_state state)
{
    switch (state)
    {
        case batch_state::IDLE:
            return "idle";
        case batch_state::RUNNING:
            return "running";
        case batch_state::COMPLETED:
            return "completed";
        case batch_state::FAILED:
            return "failed";
        case batch_state::CANCELED:
        default:
            return "canceled";
    }
}

std::ostream&
operator<<(std::ostream& stream, batch_state state)
{
    return stream << get_batch_state_name(state);
}

namespace detail {

// Item progress is stored as an integer from 0 to this value so that it can
// be updated atomically. A negative value means that no progress has been
// reported for the current item.
int constexpr encoded_item_progress_max = 1000;

// everything associated with a single run of a batch
struct batch_run : noncopyable
{
    batch_run(task_list tasks, batch_callbacks callbacks)
        : tasks(std::move(tasks)),
          callbacks(std::move(callbacks)),
          total(integer(this->tasks.size()))
    {
        for (auto const& id : get_task_entity_ids(this->tasks))
            entity_ids.insert(id);
    }

    task_list const tasks;
    batch_callbacks const callbacks;
    entity_id_set entity_ids;
    integer const total;

    // If this is set, the run stops the next time it checks in.
    std::atomic<bool> cancel{false};

    std::atomic<batch_state> state{batch_state::RUNNING};
    std::atomic<integer> done{0};
    std::atomic<integer> failed{0};
    std::atomic<int> item_progress{-1};

    // Once this is set, no more callbacks are started.
    std::atomic<bool> abandoned{false};

    // This is signaled when the worker is about to exit.
    std::mutex finish_mutex;
    std::condition_variable finish_signal;
    bool finished = false;

    std::thread thread;
};

} // namespace detail

typedef std::shared_ptr<detail::batch_run> batch_run_ptr;

struct batch_downloader_impl
{
    std::shared_ptr<disk_store const> store;
    http_connection_factory connection_factory;
    int stop_timeout_ms;

    // This serializes start(), cancel_and_wait() and shutdown().
    std::mutex control_mutex;
    bool shut_down = false;

    // This protects :current (but not its contents, which are either atomic
    // or protected by their own mutexes).
    mutable std::mutex run_mutex;
    batch_run_ptr current;
};

// the downloader whose worker is running on this thread (if any)
static thread_local batch_downloader_impl const* this_thread_downloader
    = nullptr;

static bool
is_own_worker_thread(batch_downloader_impl const& impl)
{
    return this_thread_downloader == &impl;
}

static batch_run_ptr
get_current_run(batch_downloader_impl const& impl)
{
    std::scoped_lock<std::mutex> lock(impl.run_mutex);
    return impl.current;
}

// Invoke one of the run's callbacks (unless it's empty or the run has been
// abandoned). Exceptions thrown by the callback are logged and dropped.
template<class Callback, class... Args>
static void
notify(detail::batch_run& run, Callback const& callback, Args&&... args)
{
    if (run.abandoned || !callback)
        return;
    try
    {
        callback(std::forward<Args>(args)...);
    }
    catch (std::exception& e)
    {
        get_logger()->error(
            "batch callback failed: {}", get_error_summary(e));
    }
}

struct batch_check_in : check_in_interface
{
    batch_check_in(detail::batch_run& run) : run_(run)
    {
    }

    void
    operator()()
    {
        if (run_.cancel.load(std::memory_order_relaxed))
            VITRINE_THROW(batch_canceled());
    }

 private:
    detail::batch_run& run_;
};

struct item_progress_reporter : progress_reporter_interface
{
    item_progress_reporter(detail::batch_run& run) : run_(run)
    {
    }

    void
    operator()(float progress)
    {
        run_.item_progress.store(
            int(progress * float(detail::encoded_item_progress_max)),
            std::memory_order_relaxed);
    }

 private:
    detail::batch_run& run_;
};

static void
advance_progress(detail::batch_run& run)
{
    run.item_progress.store(-1, std::memory_order_relaxed);
    integer done = ++run.done;
    notify(run, run.callbacks.on_progress, done, run.total);
}

static void
report_item_failure(
    detail::batch_run& run, download_task const& task, string message)
{
    if (task.expires_hint
        && *task.expires_hint <= std::chrono::system_clock::now())
    {
        message += " (the source URL has expired)";
    }
    get_logger()->warn(
        "failed to download {}: {}", lexical_cast<string>(task), message);
    ++run.failed;
    notify(run, run.callbacks.on_item_failed, task.key, message);
    advance_progress(run);
}

static void
process_task(
    detail::batch_run& run,
    disk_store const& store,
    http_connection_interface& connection,
    download_task const& task)
{
    // If the artifact is already on disk, there's nothing to fetch.
    if (auto size = store.artifact_size(task.key); size && *size > 0)
    {
        get_logger()->debug(
            "already cached: {}", lexical_cast<string>(task.key));
        notify(
            run,
            run.callbacks.on_item_available,
            task.key,
            store.artifact_path(task.key),
            *size);
        advance_progress(run);
        return;
    }

    // A failure here fails the batch before the item is reported as started.
    auto writer = store.begin_write(task.key);

    notify(run, run.callbacks.on_item_started, task.key);

    batch_check_in check_in(run);
    item_progress_reporter reporter(run);
    try
    {
        connection.perform_request(
            check_in, reporter, make_get_request(task.source_url), *writer);
    }
    catch (http_request_failure& e)
    {
        writer->abandon();
        report_item_failure(run, task, get_error_summary(e));
        return;
    }
    catch (bad_http_status_code& e)
    {
        writer->abandon();
        auto response = get_error_info<http_response_info>(e);
        report_item_failure(
            run,
            task,
            "HTTP status "
                + (response ? lexical_cast<string>(response->status_code)
                            : string("unknown")));
        return;
    }
    catch (...)
    {
        // Cancellation or a batch-level failure: the item was started, so
        // report that it's not coming before passing the exception on.
        writer->abandon();
        notify(run, run.callbacks.on_item_aborted, task.key);
        throw;
    }

    if (writer->bytes_written() == 0)
    {
        writer->abandon();
        report_item_failure(run, task, "empty response body");
        return;
    }

    try
    {
        writer->commit();
    }
    catch (...)
    {
        notify(run, run.callbacks.on_item_aborted, task.key);
        throw;
    }
    get_logger()->debug(
        "downloaded {} ({} bytes)",
        lexical_cast<string>(task.key),
        writer->bytes_written());
    notify(
        run,
        run.callbacks.on_item_available,
        task.key,
        writer->final_path(),
        integer(writer->bytes_written()));
    advance_progress(run);
}

static void
run_batch(
    batch_downloader_impl const* owner,
    batch_run_ptr run,
    std::shared_ptr<disk_store const> store,
    http_connection_factory connection_factory)
{
    this_thread_downloader = owner;
    auto logger = get_logger();
    try
    {
        auto connection = connection_factory();
        for (auto const& task : run->tasks)
        {
            if (run->cancel.load(std::memory_order_relaxed))
                break;
            process_task(*run, *store, *connection, task);
        }
        if (run->cancel.load(std::memory_order_relaxed))
        {
            run->state = batch_state::CANCELED;
        }
        else
        {
            logger->info(
                "batch finished: {} task(s), {} failed",
                run->total,
                run->failed.load());
            run->state = batch_state::COMPLETED;
            notify(*run, run->callbacks.on_done);
        }
    }
    catch (batch_canceled&)
    {
        run->state = batch_state::CANCELED;
    }
    catch (std::exception& e)
    {
        auto message = get_error_summary(e);
        logger->error("batch failed: {}", message);
        logger->debug("{}", e.what());
        run->state = batch_state::FAILED;
        notify(*run, run->callbacks.on_error, message);
    }
    if (run->state == batch_state::CANCELED)
    {
        logger->info(
            "batch canceled after {} of {} task(s)",
            run->done.load(),
            run->total);
    }
    {
        std::scoped_lock<std::mutex> lock(run->finish_mutex);
        run->finished = true;
    }
    run->finish_signal.notify_all();
}

// Cancel :run and wait for it to finish. If it doesn't finish within the stop
// timeout, abandon it. Returns true iff it finished.
static bool
retire_run(batch_downloader_impl const& impl, detail::batch_run& run)
{
    run.cancel = true;
    bool finished;
    {
        std::unique_lock<std::mutex> lock(run.finish_mutex);
        finished = run.finish_signal.wait_for(
            lock, std::chrono::milliseconds(impl.stop_timeout_ms), [&] {
                return run.finished;
            });
    }
    if (finished)
    {
        if (run.thread.joinable())
            run.thread.join();
        return true;
    }
    // A callback that's running now isn't waited for.
    run.abandoned = true;
    get_logger()->warn(
        "batch worker didn't stop within {} ms; abandoning it",
        impl.stop_timeout_ms);
    run.state = batch_state::CANCELED;
    if (run.thread.joinable())
        run.thread.detach();
    return false;
}

batch_downloader::batch_downloader(
    std::shared_ptr<disk_store const> store,
    http_connection_factory connection_factory,
    int stop_timeout_ms)
    : impl_(new batch_downloader_impl)
{
    impl_->store = std::move(store);
    impl_->connection_factory = std::move(connection_factory);
    impl_->stop_timeout_ms = stop_timeout_ms;
}

batch_downloader::~batch_downloader()
{
    shutdown();
}

bool
batch_downloader::start(task_list tasks, batch_callbacks callbacks)
{
    VITRINE_LOG_CALL(<< VITRINE_LOG_ARG(tasks.size()))

    auto& impl = *impl_;
    if (is_own_worker_thread(impl))
    {
        get_logger()->error(
            "refusing to start a batch from within a batch callback");
        return false;
    }

    std::scoped_lock<std::mutex> control_lock(impl.control_mutex);
    if (impl.shut_down)
    {
        get_logger()->warn("refusing to start a batch after shutdown");
        return false;
    }

    if (auto previous = get_current_run(impl))
    {
        if (previous->state == batch_state::RUNNING)
            get_logger()->info("superseding the running batch");
        retire_run(impl, *previous);
    }

    auto run = std::make_shared<detail::batch_run>(
        std::move(tasks), std::move(callbacks));
    {
        std::scoped_lock<std::mutex> lock(impl.run_mutex);
        impl.current = run;
    }
    get_logger()->info(
        "starting a batch of {} task(s) for {} entit(ies)",
        run->total,
        run->entity_ids.size());
    try
    {
        run->thread = std::thread(
            run_batch, &impl, run, impl.store, impl.connection_factory);
    }
    catch (std::system_error& e)
    {
        get_logger()->error("failed to start batch worker: {}", e.what());
        run->state = batch_state::FAILED;
        std::scoped_lock<std::mutex> lock(impl.run_mutex);
        impl.current.reset();
        return false;
    }
    return true;
}

void
batch_downloader::stop()
{
    if (auto run = get_current_run(*impl_))
        run->cancel = true;
}

bool
batch_downloader::cancel_and_wait()
{
    auto& impl = *impl_;
    if (is_own_worker_thread(impl))
    {
        // Waiting here would wait on ourselves.
        get_logger()->error(
            "cancel_and_wait() called from within a batch callback");
        stop();
        return false;
    }
    std::scoped_lock<std::mutex> control_lock(impl.control_mutex);
    auto run = get_current_run(impl);
    return run ? retire_run(impl, *run) : true;
}

bool
batch_downloader::is_running() const
{
    auto run = get_current_run(*impl_);
    return run && run->state == batch_state::RUNNING;
}

batch_status
batch_downloader::status() const
{
    batch_status status;
    auto run = get_current_run(*impl_);
    if (!run)
        return status;
    status.state = run->state;
    status.done = run->done;
    status.total = run->total;
    status.failed = run->failed;
    if (status.state == batch_state::RUNNING)
    {
        int progress = run->item_progress.load(std::memory_order_relaxed);
        if (progress >= 0)
        {
            status.item_progress = float(progress)
                                   / float(detail::encoded_item_progress_max);
        }
    }
    return status;
}

entity_id_set
batch_downloader::active_entity_ids() const
{
    auto run = get_current_run(*impl_);
    if (run && run->state == batch_state::RUNNING)
        return run->entity_ids;
    return entity_id_set();
}

void
batch_downloader::shutdown()
{
    auto& impl = *impl_;
    if (is_own_worker_thread(impl))
    {
        get_logger()->error("shutdown() called from within a batch callback");
        stop();
        return;
    }
    std::scoped_lock<std::mutex> control_lock(impl.control_mutex);
    impl.shut_down = true;
    if (auto run = get_current_run(impl))
        retire_run(impl, *run);
}

bool
batch_downloader::is_shut_down() const
{
    std::scoped_lock<std::mutex> control_lock(impl_->control_mutex);
    return impl_->shut_down;
}

} // namespace vitrine
