#include "../error.h"
#include "../logger.h"
#include "../or_throw.h"
#include "temp_entry.h"

#define _LOGPFX "Temp entry: "
#define _DEBUG(...) LOG_DEBUG(_LOGPFX, __VA_ARGS__)
#define _WARN(...)  LOG_WARN(_LOGPFX, __VA_ARGS__)

namespace tmpguard { namespace util {

namespace errc = boost::system::errc;

std::ostream& operator<<(std::ostream& os, ownership o) {
    switch (o) {
        case ownership::owned:    return os << "owned";
        case ownership::borrowed: return os << "borrowed";
    }
    return os << "???";
}

std::ostream& operator<<(std::ostream& os, deletion_state s) {
    switch (s) {
        case deletion_state::active:             return os << "active";
        case deletion_state::deleted:            return os << "deleted";
        case deletion_state::deletion_failed:    return os << "deletion_failed";
        case deletion_state::deletion_attempted: return os << "deletion_attempted";
        case deletion_state::released:           return os << "released";
    }
    return os << "???";
}

//--------------------------------------------------------------------
pending_entry::pending_entry(pending_entry&& other)
    : _path(std::move(other._path))
    , _kind(other._kind)
    , _fd(other._fd)
    , _created(other._created)
    , _engaged(other._engaged)
{
    other._fd = file_io::invalid_handle;
    other._engaged = false;
}

pending_entry& pending_entry::operator=(pending_entry&& other)
{
    if (this == &other) return *this;
    discard();
    _path = std::move(other._path);
    _kind = other._kind;
    _fd = other._fd;
    _created = other._created;
    _engaged = other._engaged;
    other._fd = file_io::invalid_handle;
    other._engaged = false;
    return *this;
}

file_io::native_handle_t pending_entry::release()
{
    auto fd = _fd;
    _fd = file_io::invalid_handle;
    _engaged = false;
    return fd;
}

void pending_entry::discard()
{
    if (!_engaged) return;
    _engaged = false;

    file_io::close_fd(_fd);
    _fd = file_io::invalid_handle;

    if (!_created) return;

    _DEBUG("Removing abandoned ", _kind, ": ", _path);
    sys::error_code ec;
    remove_entry(_path, _kind, ec);
    if (ec) _WARN("Failed to remove abandoned ", _kind, ": ", _path, " ec:", ec);
}

//--------------------------------------------------------------------
sys::error_code removal_error(const file_io::removal_failures& failures)
{
    if (failures.empty()) return {};
    if (failures.size() == 1) return failures.front().ec;
    return error::removal_incomplete;
}

file_io::removal_failures
remove_entry(const fs::path& path, entry_kind kind, sys::error_code& ec)
{
    file_io::removal_failures failures;

    if (kind == entry_kind::file) {
        file_io::remove_file(path, ec);
        if (ec) failures.push_back({path, ec});
        return failures;
    }

    file_io::remove_tree(path, failures);
    ec = removal_error(failures);
    return failures;
}

static
void log_removal_failures( const fs::path& path
                         , const file_io::removal_failures& failures)
{
    for (const auto& f : failures) {
        _WARN("Failed to remove ", f.path, " (under ", path, ") ec:", f.ec);
    }
}

//--------------------------------------------------------------------
temp_entry::temp_entry( fs::path path
                      , entry_kind kind
                      , ownership own
                      , FsWorker::WeakRef worker)
    : _path(std::move(path))
    , _kind(kind)
    , _ownership(own)
    , _worker(std::move(worker))
{}

temp_entry::temp_entry(temp_entry&& other)
    : _path(std::move(other._path))
    , _kind(other._kind)
    , _ownership(other._ownership)
    , _state(other._state)
    , _worker(std::move(other._worker))
    , _removal_failures(std::move(other._removal_failures))
{
    other._state = deletion_state::released;
}

temp_entry& temp_entry::operator=(temp_entry&& other)
{
    if (this == &other) return *this;
    drop();
    _path = std::move(other._path);
    _kind = other._kind;
    _ownership = other._ownership;
    _state = other._state;
    _worker = std::move(other._worker);
    _removal_failures = std::move(other._removal_failures);
    other._state = deletion_state::released;
    return *this;
}

temp_entry temp_entry::borrow() const
{
    return temp_entry(_path, _kind, ownership::borrowed, _worker);
}

void temp_entry::remove(asio::yield_context yield)
{
    if (_state != deletion_state::active) {
        return or_throw(yield, error::already_consumed);
    }

    if (_ownership == ownership::borrowed) {
        _state = deletion_state::released;
        return;
    }

    auto job = [path = _path, kind = _kind] (sys::error_code& ec) {
        return remove_entry(path, kind, ec);
    };

    sys::error_code ec;
    _removal_failures = run_blocking(_worker, std::move(job), yield[ec]);

    if (ec) {
        _state = deletion_state::deletion_failed;
        _DEBUG("Failed to remove ", _kind, ": ", _path, " ec:", ec);
        return or_throw(yield, ec);
    }

    _state = deletion_state::deleted;
    _DEBUG("Removed ", _kind, ": ", _path);
}

void temp_entry::drop()
{
    if (_state != deletion_state::active) return;

    if (_ownership == ownership::borrowed) {
        _state = deletion_state::released;
        return;
    }

    _state = deletion_state::deletion_attempted;

    // Nothing may escape from here, this runs in destructors.
    try {
        auto job = [path = _path, kind = _kind] {
            sys::error_code ec;
            auto failures = remove_entry(path, kind, ec);
            if (ec) log_removal_failures(path, failures);
        };

        auto worker = _worker.lock();
        if (worker && worker->post(job)) {
            _DEBUG("Handed over removal of ", _kind, ": ", _path);
            return;
        }

        _DEBUG("Removing ", _kind, " in place: ", _path);
        job();
    }
    catch (const std::exception& e) {
        _WARN("Failed to remove ", _kind, ": ", _path, " e:", e.what());
    }
}

//--------------------------------------------------------------------
namespace detail {

static
fs::path absolute_path(const fs::path& path, sys::error_code& ec)
{
    if (path.is_absolute()) return path;

    auto cwd = fs::current_path(ec);
    if (ec) return {};
    return cwd / path;
}

fs::path resolve_directory(const boost::optional<fs::path>& dir, sys::error_code& ec)
{
    if (!dir) return fs::temp_directory_path(ec);

    if (dir->empty()) {
        ec = error::invalid_input;
        return {};
    }

    return absolute_path(*dir, ec);
}

pending_entry create_unique( const fs::path& dir
                           , entry_kind kind
                           , const std::function<std::string(sys::error_code&)>& next_name
                           , unsigned attempts
                           , sys::error_code& ec)
{
    for (unsigned i = 0; i < attempts; ++i) {
        auto name = next_name(ec);
        if (ec) return {};

        auto path = dir / name;
        auto fd = file_io::create_exclusive(path, kind, ec);
        if (!ec) {
            _DEBUG("Created ", kind, ": ", path);
            return pending_entry(std::move(path), kind, fd, true);
        }

        // A single name (e.g. a custom one) reports the collision as is.
        if (ec != errc::file_exists || attempts == 1) return {};
        _DEBUG("Name already taken: ", path);
        ec.clear();
    }

    ec = error::name_collision_exhausted;
    return {};
}

pending_entry create( entry_kind kind
                    , const boost::optional<fs::path>& dir
                    , const boost::optional<std::string>& name
                    , name_scheme scheme
                    , sys::error_code& ec)
{
    auto parent = resolve_directory(dir, ec);
    if (ec) return {};

    auto next_name = [&] (sys::error_code& ec) {
        return generate_name(kind, name, scheme, ec);
    };

    // Custom names are never retried, the caller owns the collision risk.
    return create_unique(parent, kind, next_name, name ? 1 : max_name_attempts, ec);
}

pending_entry open_existing( const fs::path& given_path
                           , entry_kind kind
                           , file_io::access_mode mode
                           , sys::error_code& ec)
{
    if (given_path.empty()) {
        ec = error::invalid_input;
        return {};
    }

    auto path = absolute_path(given_path, ec);
    if (ec) return {};

    auto st = fs::status(path, ec);
    if (st.type() == fs::file_not_found) {
        ec = error::not_found;
        return {};
    }
    if (ec) return {};

    if (kind == entry_kind::directory) {
        if (st.type() != fs::directory_file) {
            ec = error::invalid_input;
            return {};
        }
        // Paths like "." or "dir/.." cannot be removed as given.
        path = fs::canonical(path, ec);
        if (ec) return {};
        return pending_entry(path, kind, file_io::invalid_handle, false);
    }

    if (st.type() != fs::regular_file) {
        ec = error::invalid_input;
        return {};
    }

    auto fd = file_io::open(path, mode, ec);
    if (ec) return {};
    return pending_entry(path, kind, fd, false);
}

} // detail namespace

}} // namespaces
