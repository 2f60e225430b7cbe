#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "file_io.h"
#include "fs_worker.h"
#include "temp_entry.h"

namespace tmpguard { namespace util {

// A temporary file open for asynchronous I/O.
//
// Files created by `make*` are owned and removed from disk when the handle
// is destroyed (see `temp_entry::drop`) or explicitly removed with `remove`.
// Use `open_rw`, `open_ro` or `clone` to get more (borrowed) handles to it;
// those never remove it.
//
// The descriptor is bound to the executor of the coroutine creating the handle.
class temp_file {
public:
    using lowest_layer_type = file_io::async_file_handle;
    using executor_type = lowest_layer_type::executor_type;

    // Create a file in the default temporary directory.
    static
    boost::optional<temp_file>
    make(asio::yield_context yield) {
        return make( FsWorker::global(), boost::none, boost::none
                   , name_scheme::random_suffix, yield);
    }

    // Create a file in `dir`, which must exist.
    static
    boost::optional<temp_file>
    make(const fs::path& dir, asio::yield_context yield) {
        return make( FsWorker::global(), dir, boost::none
                   , name_scheme::random_suffix, yield);
    }

    static
    boost::optional<temp_file>
    make( const boost::optional<fs::path>& dir
        , name_scheme scheme
        , asio::yield_context yield) {
        return make(FsWorker::global(), dir, boost::none, scheme, yield);
    }

    // Create a file with the given `name`.
    // Fails with `file_exists` if it is already there, nothing is overwritten.
    static
    boost::optional<temp_file>
    make_named( const boost::optional<fs::path>& dir
              , const std::string& name
              , asio::yield_context yield) {
        return make( FsWorker::global(), dir, name
                   , name_scheme::random_suffix, yield);
    }

    // Create a file in `dir` (or the default temporary directory)
    // named `name` (or a generated name), with blocking calls run by `worker`.
    static
    boost::optional<temp_file>
    make( FsWorker& worker
        , const boost::optional<fs::path>& dir
        , const boost::optional<std::string>& name
        , name_scheme
        , asio::yield_context);

    // Wrap an existing regular file without creating it.
    // Only if `ownership::owned` will it be removed by this handle.
    static
    boost::optional<temp_file>
    from_existing(fs::path path, ownership own, asio::yield_context yield) {
        return from_existing(FsWorker::global(), std::move(path), own, yield);
    }

    static
    boost::optional<temp_file>
    from_existing( FsWorker&
                 , fs::path
                 , ownership
                 , asio::yield_context);

public:
    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;

    temp_file(temp_file&&) = default;
    temp_file& operator=(temp_file&&);

    ~temp_file() {
        // Close before the entry gets removed.
        close_file();
    }

    const fs::path& path() const { return _entry.path(); }
    ownership get_ownership() const { return _entry.get_ownership(); }
    deletion_state state() const { return _entry.state(); }
    bool is_active() const { return _entry.is_active(); }
    file_io::access_mode mode() const { return _mode; }

    // Open another handle to the same file, which is not removed by it.
    boost::optional<temp_file> open_rw(asio::yield_context yield) {
        return open(file_io::access_mode::read_write, yield);
    }

    boost::optional<temp_file> open_ro(asio::yield_context yield) {
        return open(file_io::access_mode::read_only, yield);
    }

    // Another handle sharing a duplicate of this descriptor (and its offset),
    // see `file_io::dup_fd`.  It does not remove the file.
    boost::optional<temp_file> clone(sys::error_code&);

    // Offset shared by reads and writes, see `file_io::fseek`.
    void fseek(std::size_t pos, sys::error_code& ec) {
        file_io::fseek(_file, pos, ec);
    }

    std::size_t current_position(sys::error_code& ec) {
        return file_io::current_position(_file, ec);
    }

    std::size_t file_size(sys::error_code& ec) {
        return file_io::file_size(_file, ec);
    }

    // Close the file and remove it if owned, see `temp_entry::remove`.
    void remove(asio::yield_context);

    lowest_layer_type& lowest_layer() { return _file; }
    const lowest_layer_type& lowest_layer() const { return _file; }
    auto native_handle() { return _file.native_handle(); }

    // <AsyncReadStream+AsyncWriteStream>
    auto get_executor() { return _file.get_executor(); }

    template<class MutableBufferSequence, class Token>
    auto async_read_some(const MutableBufferSequence& mb, Token&& t) {
        return _file.async_read_some(mb, std::forward<Token>(t));
    }

    template<class ConstBufferSequence, class Token>
    auto async_write_some(const ConstBufferSequence& cb, Token&& t) {
        return _file.async_write_some(cb, std::forward<Token>(t));
    }
    // </AsyncReadStream+AsyncWriteStream>

private:
    temp_file( lowest_layer_type&& file
             , temp_entry&& entry
             , file_io::access_mode mode)
        : _entry(std::move(entry))
        , _file(std::move(file))
        , _mode(mode)
    {}

    // Turn a pending entry into a handle with its descriptor bound to `ex`.
    static
    boost::optional<temp_file>
    adopt( pending_entry&&
         , ownership
         , file_io::access_mode
         , FsWorker::WeakRef
         , const asio::any_io_executor& ex
         , sys::error_code&);

    boost::optional<temp_file> open(file_io::access_mode, asio::yield_context);

    void close_file();

    // Destroyed after `_file`, so the file is closed when the entry is dropped.
    temp_entry _entry;
    lowest_layer_type _file;
    file_io::access_mode _mode;
};

}} // namespaces
