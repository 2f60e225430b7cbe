#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "fs_worker.h"
#include "temp_entry.h"

namespace tmpguard { namespace util {

// A temporary directory, removed with all its content
// when an owning handle is destroyed or explicitly removed.
//
// Only the directory itself is tracked, entries created under it
// go away with it.  See `temp_file` for the meaning of constructors.
class temp_dir {
public:
    static
    boost::optional<temp_dir>
    make(asio::yield_context yield) {
        return make( FsWorker::global(), boost::none, boost::none
                   , name_scheme::random_suffix, yield);
    }

    static
    boost::optional<temp_dir>
    make(const fs::path& dir, asio::yield_context yield) {
        return make( FsWorker::global(), dir, boost::none
                   , name_scheme::random_suffix, yield);
    }

    static
    boost::optional<temp_dir>
    make( const boost::optional<fs::path>& dir
        , name_scheme scheme
        , asio::yield_context yield) {
        return make(FsWorker::global(), dir, boost::none, scheme, yield);
    }

    static
    boost::optional<temp_dir>
    make_named( const boost::optional<fs::path>& dir
              , const std::string& name
              , asio::yield_context yield) {
        return make( FsWorker::global(), dir, name
                   , name_scheme::random_suffix, yield);
    }

    static
    boost::optional<temp_dir>
    make( FsWorker&
        , const boost::optional<fs::path>& dir
        , const boost::optional<std::string>& name
        , name_scheme
        , asio::yield_context);

    static
    boost::optional<temp_dir>
    from_existing(fs::path path, ownership own, asio::yield_context yield) {
        return from_existing(FsWorker::global(), std::move(path), own, yield);
    }

    static
    boost::optional<temp_dir>
    from_existing( FsWorker&
                 , fs::path
                 , ownership
                 , asio::yield_context);

public:
    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    temp_dir(temp_dir&&) = default;
    temp_dir& operator=(temp_dir&&) = default;

    const fs::path& path() const { return _entry.path(); }
    ownership get_ownership() const { return _entry.get_ownership(); }
    deletion_state state() const { return _entry.state(); }
    bool is_active() const { return _entry.is_active(); }

    // Another handle to the same directory, which is not removed by it.
    boost::optional<temp_dir> borrow(sys::error_code&) const;

    // Remove the whole tree if owned, see `temp_entry::remove`.
    void remove(asio::yield_context yield) { _entry.remove(yield); }

    // Entries which could not be removed by `remove`.
    const file_io::removal_failures& removal_failures() const
    { return _entry.removal_failures(); }

private:
    temp_dir(temp_entry entry)
        : _entry(std::move(entry))
    {}

    temp_entry _entry;
};

}} // namespaces
