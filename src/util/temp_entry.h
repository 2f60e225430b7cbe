#pragma once

#include <functional>
#include <ostream>

#include <boost/asio/spawn.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "file_io.h"
#include "fs_worker.h"
#include "random_name.h"

namespace tmpguard { namespace util {

// Whether a handle is responsible for removing its entry.
enum class ownership {
    // Removes the entry when destroyed or explicitly removed.
    owned,
    // Never touches the entry on disk.
    borrowed,
};

enum class deletion_state {
    active,
    // `remove` succeeded.
    deleted,
    // `remove` failed, the error was reported to its caller.
    deletion_failed,
    // An owner was destroyed, removal was attempted or handed over.
    deletion_attempted,
    // A borrower was destroyed or removed, or the handle was moved from.
    released,
};

std::ostream& operator<<(std::ostream&, ownership);
std::ostream& operator<<(std::ostream&, deletion_state);

// An entry just created or opened on disk but not yet wrapped in a handle.
//
// Unless released, destroying it closes its descriptor
// and removes the entry if it was created for it.
// This keeps an abandoned creation (e.g. one whose waiting coroutine
// never resumes) from leaving an orphan behind.
class pending_entry {
public:
    pending_entry() = default;

    pending_entry( fs::path path
                 , entry_kind kind
                 , file_io::native_handle_t fd
                 , bool created)
        : _path(std::move(path))
        , _kind(kind)
        , _fd(fd)
        , _created(created)
        , _engaged(true)
    {}

    pending_entry(const pending_entry&) = delete;
    pending_entry& operator=(const pending_entry&) = delete;

    pending_entry(pending_entry&&);
    pending_entry& operator=(pending_entry&&);

    ~pending_entry() { discard(); }

    const fs::path& path() const { return _path; }
    entry_kind kind() const { return _kind; }
    file_io::native_handle_t native_handle() const { return _fd; }

    // Give up responsibility for the descriptor and the entry.
    file_io::native_handle_t release();

private:
    void discard();

    fs::path _path;
    entry_kind _kind = entry_kind::file;
    file_io::native_handle_t _fd = file_io::invalid_handle;
    bool _created = false;
    bool _engaged = false;
};

// The state shared by temporary file and directory handles:
// the path, who is responsible for removing it,
// and how far its removal went.
//
// Handles are movable, not copyable.
// A moved-from handle is `released`: destroying it does nothing
// and using it fails with `error::already_consumed`.
class temp_entry {
public:
    temp_entry(fs::path, entry_kind, ownership, FsWorker::WeakRef);

    temp_entry(const temp_entry&) = delete;
    temp_entry& operator=(const temp_entry&) = delete;

    temp_entry(temp_entry&&);
    temp_entry& operator=(temp_entry&&);

    ~temp_entry() { drop(); }

    const fs::path& path() const { return _path; }
    entry_kind kind() const { return _kind; }
    ownership get_ownership() const { return _ownership; }
    deletion_state state() const { return _state; }
    bool is_active() const { return _state == deletion_state::active; }

    const FsWorker::WeakRef& worker() const { return _worker; }

    // Another handle to the same path, never responsible for removing it.
    // The caller checks that this one is active.
    temp_entry borrow() const;

    // Remove the entry from disk (if owned) and wait for the outcome.
    //
    // The handle is consumed whatever the outcome,
    // so further calls fail with `error::already_consumed`.
    // A directory which could only be partially removed reports the error
    // of its only failed entry or `error::removal_incomplete`,
    // see `removal_failures` for details.
    void remove(asio::yield_context);

    // Implicit removal on destruction: nothing is reported.
    // If the worker is still around the removal is handed over to it,
    // otherwise it happens right here (blocking).
    void drop();

    // Entries which could not be removed by the last `remove`.
    const file_io::removal_failures& removal_failures() const
    { return _removal_failures; }

private:
    fs::path _path;
    entry_kind _kind;
    ownership _ownership;
    deletion_state _state = deletion_state::active;
    FsWorker::WeakRef _worker;
    file_io::removal_failures _removal_failures;
};

// The error reported for a removal with the given failures:
// none, the only one, or `error::removal_incomplete` if there are several.
sys::error_code removal_error(const file_io::removal_failures&);

// Removal of an entry of any kind, reporting as `temp_entry::remove` does.
// Blocking, used by handles from the worker or the destroying thread.
file_io::removal_failures
remove_entry(const fs::path&, entry_kind, sys::error_code&);

// Blocking steps of handle construction, run on the worker.
namespace detail {

    // Where new entries go if no directory is given.
    fs::path resolve_directory(const boost::optional<fs::path>&, sys::error_code&);

    // Create a new entry in `dir` named by `next_name`,
    // trying at most `attempts` names while they are already taken.
    // With a single attempt a taken name fails with `file_exists`,
    // otherwise running out of attempts fails with `error::name_collision_exhausted`.
    pending_entry create_unique( const fs::path& dir
                               , entry_kind
                               , const std::function<std::string(sys::error_code&)>& next_name
                               , unsigned attempts
                               , sys::error_code&);

    // Create a new entry in `dir` (or the default location).
    // A custom name is tried once, a generated one up to `max_name_attempts` times.
    pending_entry create( entry_kind
                        , const boost::optional<fs::path>& dir
                        , const boost::optional<std::string>& name
                        , name_scheme
                        , sys::error_code&);

    // Check that `path` is an existing entry of the given kind
    // and open it (files only) with the given access.
    // A relative path is resolved against the current directory,
    // directory paths are made canonical.
    pending_entry open_existing( const fs::path& path
                               , entry_kind
                               , file_io::access_mode
                               , sys::error_code&);

} // detail namespace

}} // namespaces
