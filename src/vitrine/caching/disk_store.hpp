#ifndef VITRINE_CACHING_DISK_STORE_HPP
#define VITRINE_CACHING_DISK_STORE_HPP

#include <fstream>
#include <map>
#include <memory>
#include <vector>

#include <vitrine/caching/cache_key.hpp>
#include <vitrine/io/http_requests.hpp>

namespace vitrine {

// The disk store is the persistent level of the image cache. It's simply a
// directory tree laid out according to the cache keys:
//
//   root/{entity_id}/{folder}/{filename}
//   root/{entity_id}/meta.json
//
// There is no index. The store relies on the rule that a file that exists
// under its final name has been completely written, which is guaranteed by
// writing to "{filename}.part" and renaming it once the write succeeds.
//
// The store keeps no mutable state of its own, so it can be used from
// multiple threads, but it doesn't coordinate concurrent writes to the same
// key. (The image cache only ever has one writer.)
//
// Operations that fail throw disk_store_failure (or open_file_error).

// This exception indicates a failure in the operation of the disk store.
VITRINE_DEFINE_EXCEPTION(disk_store_failure)
// This provides the path involved in the failure.
VITRINE_DEFINE_ERROR_INFO(file_path, disk_store_path)
// This exception also provides internal_error_message_info.

struct disk_store_summary
{
    // the root directory of the store
    file_path directory;

    // the number of entity directories
    integer entity_count = 0;

    // the number of complete artifact files
    integer file_count = 0;

    // the total size of those files (in bytes)
    integer total_bytes = 0;
};

// a complete artifact file as found on disk
struct stored_artifact
{
    string filename;
    file_path path;
    integer size = 0;
};

// artifacts of an entity, grouped by folder (with the sidecar listed under
// the empty folder)
typedef std::map<string, std::vector<stored_artifact>> stored_artifact_list;

// An artifact_writer streams the contents of an artifact into its ".part"
// file. commit() moves the file into place. If the writer is destroyed
// without being committed, the partial file is removed.
struct artifact_writer : http_body_sink_interface, noncopyable
{
    artifact_writer(cache_key key, file_path final_path);
    ~artifact_writer();

    void
    write(char const* data, std::size_t size) override;

    std::size_t
    bytes_written() const
    {
        return bytes_written_;
    }

    cache_key const&
    key() const
    {
        return key_;
    }

    // the path that the artifact will have once it's committed
    file_path const&
    final_path() const
    {
        return final_path_;
    }

    file_path const&
    partial_path() const
    {
        return partial_path_;
    }

    // Finish the write and rename the file to its final name.
    void
    commit();

    // Discard whatever has been written.
    // (This never throws, since it's used on error paths.)
    void
    abandon() noexcept;

 private:
    cache_key key_;
    file_path final_path_;
    file_path partial_path_;
    std::ofstream stream_;
    std::size_t bytes_written_ = 0;
    bool finished_ = false;
};

struct disk_store
{
    // Create a store rooted at :root. The directory is created if needed, and
    // any partial files left behind by an earlier process are removed.
    explicit disk_store(file_path root);

    file_path const&
    root() const
    {
        return root_;
    }

    file_path
    entity_directory(string const& entity_id) const;

    // Get the path where the artifact for :key lives (whether or not it's
    // actually there).
    file_path
    artifact_path(cache_key const& key) const;

    file_path
    sidecar_path(string const& entity_id) const;

    // Is there a complete, non-empty artifact for :key?
    bool
    contains(cache_key const& key) const;

    // Get the size of the artifact for :key, if it's present.
    optional<integer>
    artifact_size(cache_key const& key) const;

    // Read the artifact for :key. This returns none if the artifact is
    // missing or empty (including if it disappears while being read).
    optional<blob>
    read(cache_key const& key) const;

    // Begin writing the artifact for :key. The directories leading up to it
    // are created.
    std::unique_ptr<artifact_writer>
    begin_write(cache_key const& key) const;

    // Get the IDs of all entities that have directories in the store.
    std::vector<string>
    list_entities() const;

    // Get the complete artifacts stored for an entity.
    stored_artifact_list
    list_entity_artifacts(string const& entity_id) const;

    // Does the store hold at least one complete artifact for :entity_id?
    bool
    has_entity_artifacts(string const& entity_id) const;

    // Remove an entity's directory (and everything in it).
    // It's not an error if the entity isn't present.
    void
    remove_entity(string const& entity_id) const;

    // Remove all partial files in the store.
    // Returns the number of files removed. Failures are logged and skipped.
    integer
    remove_partial_files() const;

    // Delete the entire contents of the store and recreate the empty root.
    void
    reset() const;

    // Walk the store and summarize its contents. Entries that vanish during
    // the walk are skipped.
    disk_store_summary
    summarize() const;

 private:
    file_path root_;
};

// Does :path name a partial file?
bool
is_partial_file(file_path const& path);

} // namespace vitrine

#endif
