#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"
#include "temp_dir.h"

namespace tmpguard { namespace util {

using OptDir = boost::optional<temp_dir>;

OptDir
temp_dir::make( FsWorker& worker
              , const boost::optional<fs::path>& dir
              , const boost::optional<std::string>& name
              , name_scheme scheme
              , asio::yield_context yield)
{
    sys::error_code ec;

    auto pending = worker.run([dir, name, scheme] (sys::error_code& ec) {
        return detail::create(entry_kind::directory, dir, name, scheme, ec);
    }, yield[ec]);
    if (ec) return or_throw<OptDir>(yield, ec);

    pending.release();
    return temp_dir(temp_entry( pending.path(), entry_kind::directory
                              , ownership::owned, worker.weak_ref()));
}

OptDir
temp_dir::from_existing( FsWorker& worker
                       , fs::path path
                       , ownership own
                       , asio::yield_context yield)
{
    sys::error_code ec;

    auto pending = worker.run([path] (sys::error_code& ec) {
        return detail::open_existing( path, entry_kind::directory
                                    , file_io::access_mode::read_write, ec);
    }, yield[ec]);
    if (ec) return or_throw<OptDir>(yield, ec);

    pending.release();
    LOG_DEBUG("Temp dir: Wrapped ", pending.path(), " (", own, ")");
    return temp_dir(temp_entry( pending.path(), entry_kind::directory
                              , own, worker.weak_ref()));
}

OptDir
temp_dir::borrow(sys::error_code& ec) const
{
    if (!is_active()) {
        ec = error::already_consumed;
        return boost::none;
    }
    return temp_dir(_entry.borrow());
}

}} // namespaces
