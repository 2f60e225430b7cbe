#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"
#include "temp_file.h"

namespace tmpguard { namespace util {

using OptFile = boost::optional<temp_file>;

temp_file& temp_file::operator=(temp_file&& other)
{
    if (this == &other) return *this;
    close_file();
    _file = std::move(other._file);
    _entry = std::move(other._entry);
    _mode = other._mode;
    return *this;
}

void temp_file::close_file()
{
    sys::error_code ignored_ec;
    _file.close(ignored_ec);
}

OptFile
temp_file::adopt( pending_entry&& pending
                , ownership own
                , file_io::access_mode mode
                , FsWorker::WeakRef worker
                , const asio::any_io_executor& ex
                , sys::error_code& ec)
{
    lowest_layer_type file(ex);
    file.assign(pending.native_handle(), ec);
    // The pending entry still cleans up after itself.
    if (ec) return boost::none;
    pending.release();

    LOG_DEBUG("Temp file: Opened ", pending.path(), " (", own, ", ", mode, ")");
    return temp_file( std::move(file)
                    , temp_entry(pending.path(), entry_kind::file, own, std::move(worker))
                    , mode);
}

OptFile
temp_file::make( FsWorker& worker
               , const boost::optional<fs::path>& dir
               , const boost::optional<std::string>& name
               , name_scheme scheme
               , asio::yield_context yield)
{
    sys::error_code ec;

    auto pending = worker.run([dir, name, scheme] (sys::error_code& ec) {
        return detail::create(entry_kind::file, dir, name, scheme, ec);
    }, yield[ec]);
    if (ec) return or_throw<OptFile>(yield, ec);

    auto file = adopt( std::move(pending), ownership::owned
                     , file_io::access_mode::read_write
                     , worker.weak_ref(), yield_executor(yield), ec);
    return or_throw(yield, ec, std::move(file));
}

OptFile
temp_file::from_existing( FsWorker& worker
                        , fs::path path
                        , ownership own
                        , asio::yield_context yield)
{
    sys::error_code ec;

    auto pending = worker.run([path] (sys::error_code& ec) {
        return detail::open_existing( path, entry_kind::file
                                    , file_io::access_mode::read_write, ec);
    }, yield[ec]);
    if (ec) return or_throw<OptFile>(yield, ec);

    auto file = adopt( std::move(pending), own
                     , file_io::access_mode::read_write
                     , worker.weak_ref(), yield_executor(yield), ec);
    return or_throw(yield, ec, std::move(file));
}

OptFile
temp_file::open(file_io::access_mode mode, asio::yield_context yield)
{
    if (!is_active()) return or_throw<OptFile>(yield, error::already_consumed);

    sys::error_code ec;

    auto pending = run_blocking(_entry.worker(), [path = path(), mode] (sys::error_code& ec) {
        return detail::open_existing(path, entry_kind::file, mode, ec);
    }, yield[ec]);
    if (ec) return or_throw<OptFile>(yield, ec);

    auto file = adopt( std::move(pending), ownership::borrowed, mode
                     , _entry.worker(), yield_executor(yield), ec);
    return or_throw(yield, ec, std::move(file));
}

OptFile
temp_file::clone(sys::error_code& ec)
{
    if (!is_active()) {
        ec = error::already_consumed;
        return boost::none;
    }

    auto fd = file_io::dup_fd(_file, ec);
    if (ec) return boost::none;

    lowest_layer_type file(_file.get_executor());
    file.assign(fd, ec);
    if (ec) {
        file_io::close_fd(fd);
        return boost::none;
    }

    return temp_file(std::move(file), _entry.borrow(), _mode);
}

void
temp_file::remove(asio::yield_context yield)
{
    if (!is_active()) return or_throw(yield, error::already_consumed);
    close_file();
    _entry.remove(yield);
}

}} // namespaces
