#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vitrine/core/logging.hpp>
#include <vitrine/fs/file_io.h>
#include <vitrine/service/config.hpp>
#include <vitrine/service/image_cache.h>
#include <vitrine/utilities/errors.h>

using namespace vitrine;

static entity_id_set
parse_entity_id_list(string const& text)
{
    std::vector<string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));
    entity_id_set ids;
    for (auto& part : parts)
    {
        boost::algorithm::trim(part);
        if (!part.empty())
            ids.insert(part);
    }
    return ids;
}

static void
show_stats(cache_stats const& stats)
{
    std::cout << "directory: " << stats.directory.string() << "\n"
              << "entities: " << stats.entity_count << "\n"
              << "files: " << stats.file_count << "\n"
              << "total bytes: " << stats.total_bytes << "\n"
              << "memory entries: " << stats.memory_entry_count << "\n";
}

static void
show_entity_artifacts(product_image_cache& cache, string const& entity_id)
{
    auto artifacts = cache.list_entity_artifacts(entity_id);
    if (artifacts.empty())
    {
        std::cout << entity_id << ": not cached\n";
        return;
    }
    for (auto const& [folder, files] : artifacts)
    {
        std::cout << (folder.empty() ? string("(root)") : folder) << ":\n";
        for (auto const& file : files)
        {
            std::cout << "  " << file.filename << " (" << file.size
                      << " bytes)\n";
        }
    }
}

// the state shared between the main thread and the batch callbacks
struct batch_completion
{
    std::mutex mutex;
    std::condition_variable signal;
    bool finished = false;
};

// Run a batch and wait for it to finish. Returns whether every task
// succeeded.
static bool
run_batch_to_completion(product_image_cache& cache, task_list tasks)
{
    // The callbacks own the completion state too, since they may still be
    // running when this returns.
    auto completion = std::make_shared<batch_completion>();
    auto finish = [completion] {
        {
            std::scoped_lock<std::mutex> lock(completion->mutex);
            completion->finished = true;
        }
        completion->signal.notify_all();
    };

    batch_callbacks callbacks;
    callbacks.on_progress = [](integer done, integer total) {
        std::cout << "\r" << done << "/" << total << std::flush;
    };
    callbacks.on_item_failed
        = [](cache_key const& key, string const& message) {
              std::cerr << "\n" << key << ": " << message << "\n";
          };
    callbacks.on_done = finish;
    callbacks.on_error = [finish](string const& message) {
        std::cerr << "\nbatch failed: " << message << "\n";
        finish();
    };

    if (!cache.start_batch(std::move(tasks), std::move(callbacks)))
    {
        std::cerr << "unable to start the batch\n";
        return false;
    }

    // A batch that's canceled invokes neither on_done nor on_error, so the
    // batch state is polled as well.
    {
        std::unique_lock<std::mutex> lock(completion->mutex);
        while (!completion->signal.wait_for(
            lock, std::chrono::milliseconds(100), [&] {
                return completion->finished;
            }))
        {
            if (cache.get_batch_status().state != batch_state::RUNNING)
                break;
        }
    }
    std::cout << "\n";

    auto status = cache.get_batch_status();
    if (status.failed != 0)
    {
        std::cerr << status.failed << " of " << status.total
                  << " download(s) failed\n";
    }
    return status.state == batch_state::COMPLETED && status.failed == 0;
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    // clang-format off
    desc.add_options()
        ("help", "show help message")
        ("config-file", po::value<string>(),
            "specify the configuration file to use")
        ("cache-dir", po::value<string>(),
            "override the cache directory")
        ("log-level", po::value<string>(),
            "set the log level (trace, debug, info, warn, error, off)")
        ("tasks", po::value<string>(),
            "download the tasks listed in a JSON file")
        ("scope", po::value<string>(),
            "set the page scope to a comma-separated list of entity IDs")
        ("evict", "evict everything outside the page scope")
        ("clear", "delete everything in the cache")
        ("list", po::value<string>(),
            "list the cached artifacts of an entity")
        ("stats", "show cache statistics")
    ;
    // clang-format on

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << e.what() << "\n" << desc;
        return 1;
    }

    if (vm.count("help"))
    {
        std::cout << desc;
        return 0;
    }

    auto logger = spdlog::stderr_color_mt("vitrine");

    try
    {
        optional<file_path> config_path;
        if (vm.count("config-file"))
            config_path = file_path(vm["config-file"].as<string>());
        else
            config_path = find_default_config_file();

        cache_config config;
        if (config_path)
            config = read_cache_config(*config_path);
        if (vm.count("cache-dir"))
            config.directory = vm["cache-dir"].as<string>();
        if (vm.count("log-level"))
            config.log_level = vm["log-level"].as<string>();
        if (config.log_level)
            logger->set_level(parse_log_level(*config.log_level));

        product_image_cache cache(config);

        bool succeeded = true;

        if (vm.count("clear"))
            cache.clear_all();

        if (vm.count("scope"))
        {
            cache.set_page_scope(
                parse_entity_id_list(vm["scope"].as<string>()));
        }

        if (vm.count("tasks"))
        {
            auto tasks = parse_task_list_json(
                read_file_contents(vm["tasks"].as<string>()));
            succeeded = run_batch_to_completion(cache, std::move(tasks));
        }

        if (vm.count("evict"))
        {
            auto removed = cache.evict_outside_scope();
            std::cout << "evicted " << removed << " entit(ies)\n";
        }

        if (vm.count("list"))
            show_entity_artifacts(cache, vm["list"].as<string>());

        if (vm.count("stats"))
            show_stats(cache.stats());

        cache.shutdown();
        return succeeded ? 0 : 2;
    }
    catch (std::exception& e)
    {
        logger->error("{}", get_error_summary(e));
        logger->debug("{}", e.what());
        return 1;
    }
}
