#include <vitrine/caching/disk_store.hpp>

#include <algorithm>
#include <system_error>

#include <boost/algorithm/string/predicate.hpp>

#include <vitrine/core/logging.hpp>
#include <vitrine/fs/file_io.h>
#include <vitrine/fs/utilities.h>

namespace vitrine {

namespace fs = std::filesystem;

bool
is_partial_file(file_path const& path)
{
    return boost::algorithm::ends_with(
        path.filename().string(), partial_file_suffix);
}

static void
throw_disk_store_failure(file_path const& path, std::error_code const& error)
{
    VITRINE_THROW(
        disk_store_failure() << disk_store_path_info(path)
                             << internal_error_message_info(error.message()));
}

static void
create_directories_or_throw(file_path const& dir)
{
    std::error_code error;
    fs::create_directories(dir, error);
    if (error)
        throw_disk_store_failure(dir, error);
}

// artifact_writer

artifact_writer::artifact_writer(cache_key key, file_path final_path)
    : key_(std::move(key)), final_path_(std::move(final_path))
{
    partial_path_ = final_path_;
    partial_path_ += partial_file_suffix;
    create_directories_or_throw(final_path_.parent_path());
    open_file(
        stream_,
        partial_path_,
        std::ios::out | std::ios::trunc | std::ios::binary);
}

artifact_writer::~artifact_writer()
{
    if (!finished_)
        abandon();
}

void
artifact_writer::write(char const* data, std::size_t size)
{
    try
    {
        stream_.write(data, std::streamsize(size));
    }
    catch (std::ios_base::failure& e)
    {
        VITRINE_THROW(
            disk_store_failure() << disk_store_path_info(partial_path_)
                                 << internal_error_message_info(e.what()));
    }
    bytes_written_ += size;
}

void
artifact_writer::commit()
{
    try
    {
        stream_.close();
    }
    catch (std::ios_base::failure& e)
    {
        VITRINE_THROW(
            disk_store_failure() << disk_store_path_info(partial_path_)
                                 << internal_error_message_info(e.what()));
    }
    std::error_code error;
    fs::rename(partial_path_, final_path_, error);
    if (error)
        throw_disk_store_failure(final_path_, error);
    finished_ = true;
}

void
artifact_writer::abandon() noexcept
{
    finished_ = true;
    // Clear the exception mask first so that closing a failed stream can't
    // throw.
    stream_.exceptions(std::ios::goodbit);
    stream_.close();
    std::error_code error;
    fs::remove(partial_path_, error);
    if (error)
    {
        get_logger()->warn(
            "failed to remove partial file {}: {}",
            partial_path_.string(),
            error.message());
    }
}

// disk_store

disk_store::disk_store(file_path root) : root_(std::move(root))
{
    create_directories_or_throw(root_);
    auto removed = remove_partial_files();
    if (removed != 0)
    {
        get_logger()->info(
            "removed {} stale partial file(s) from {}",
            removed,
            root_.string());
    }
}

file_path
disk_store::entity_directory(string const& entity_id) const
{
    return root_ / entity_id;
}

file_path
disk_store::artifact_path(cache_key const& key) const
{
    auto dir = entity_directory(key.entity_id);
    if (!key.folder.empty())
        dir /= key.folder;
    return dir / key.filename;
}

file_path
disk_store::sidecar_path(string const& entity_id) const
{
    return entity_directory(entity_id) / sidecar_filename;
}

optional<integer>
disk_store::artifact_size(cache_key const& key) const
{
    auto path = artifact_path(key);
    std::error_code error;
    if (!fs::is_regular_file(path, error) || error)
        return none;
    auto size = fs::file_size(path, error);
    if (error)
        return none;
    return integer(size);
}

bool
disk_store::contains(cache_key const& key) const
{
    auto size = artifact_size(key);
    return size && *size > 0;
}

optional<blob>
disk_store::read(cache_key const& key) const
{
    if (!contains(key))
        return none;
    blob contents;
    try
    {
        contents = read_file_blob(artifact_path(key));
    }
    catch (open_file_error&)
    {
        // The file was removed after the existence check.
        return none;
    }
    if (contents.size == 0)
        return none;
    return contents;
}

std::unique_ptr<artifact_writer>
disk_store::begin_write(cache_key const& key) const
{
    return std::make_unique<artifact_writer>(key, artifact_path(key));
}

std::vector<string>
disk_store::list_entities() const
{
    std::vector<string> entities;
    std::error_code error;
    fs::directory_iterator i(root_, error);
    if (error)
        throw_disk_store_failure(root_, error);
    for (fs::directory_iterator end; !error && i != end; i.increment(error))
    {
        std::error_code entry_error;
        if (i->is_directory(entry_error))
            entities.push_back(i->path().filename().string());
    }
    if (error)
        throw_disk_store_failure(root_, error);
    return entities;
}

stored_artifact_list
disk_store::list_entity_artifacts(string const& entity_id) const
{
    stored_artifact_list artifacts;
    auto dir = entity_directory(entity_id);
    std::error_code error;
    if (!fs::is_directory(dir, error))
        return artifacts;
    fs::recursive_directory_iterator i(dir, error);
    for (fs::recursive_directory_iterator end; !error && i != end;
         i.increment(error))
    {
        std::error_code entry_error;
        if (!i->is_regular_file(entry_error) || is_partial_file(i->path()))
            continue;
        auto size = i->file_size(entry_error);
        if (entry_error || size == 0)
            continue;
        auto folder = i->path().parent_path().lexically_relative(dir);
        artifacts[folder == "." ? string() : folder.generic_string()]
            .push_back(stored_artifact{
                i->path().filename().string(), i->path(), integer(size)});
    }
    for (auto& [folder, files] : artifacts)
    {
        std::ranges::sort(files, [](auto const& a, auto const& b) {
            return a.filename < b.filename;
        });
    }
    return artifacts;
}

bool
disk_store::has_entity_artifacts(string const& entity_id) const
{
    return !list_entity_artifacts(entity_id).empty();
}

void
disk_store::remove_entity(string const& entity_id) const
{
    auto dir = entity_directory(entity_id);
    std::error_code error;
    fs::remove_all(dir, error);
    if (error)
        throw_disk_store_failure(dir, error);
}

integer
disk_store::remove_partial_files() const
{
    std::vector<file_path> partial_files;
    std::error_code error;
    fs::recursive_directory_iterator i(root_, error);
    for (fs::recursive_directory_iterator end; !error && i != end;
         i.increment(error))
    {
        std::error_code entry_error;
        if (i->is_regular_file(entry_error) && is_partial_file(i->path()))
            partial_files.push_back(i->path());
    }
    integer removed = 0;
    for (auto const& path : partial_files)
    {
        std::error_code remove_error;
        if (fs::remove(path, remove_error))
        {
            ++removed;
        }
        else if (remove_error)
        {
            get_logger()->warn(
                "failed to remove partial file {}: {}",
                path.string(),
                remove_error.message());
        }
    }
    return removed;
}

void
disk_store::reset() const
{
    std::error_code error;
    fs::remove_all(root_, error);
    if (error)
        throw_disk_store_failure(root_, error);
    create_directories_or_throw(root_);
}

disk_store_summary
disk_store::summarize() const
{
    disk_store_summary summary;
    summary.directory = root_;
    std::error_code error;
    fs::directory_iterator top(root_, error);
    for (fs::directory_iterator end; !error && top != end;
         top.increment(error))
    {
        std::error_code entry_error;
        if (!top->is_directory(entry_error))
            continue;
        ++summary.entity_count;
        fs::recursive_directory_iterator i(top->path(), entry_error);
        for (fs::recursive_directory_iterator files_end;
             !entry_error && i != files_end;
             i.increment(entry_error))
        {
            std::error_code file_error;
            if (!i->is_regular_file(file_error) || is_partial_file(i->path()))
                continue;
            auto size = i->file_size(file_error);
            // The file may have been evicted since it was listed.
            if (file_error)
                continue;
            ++summary.file_count;
            summary.total_bytes += integer(size);
        }
    }
    return summary;
}

} // namespace vitrine
