#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "file_io.h"

namespace tmpguard { namespace util { namespace file_io {

namespace errc = boost::system::errc;

static
sys::error_code last_error()
{
    return make_error_code(static_cast<errc::errc_t>(errno));
}

static
void set_last_error(sys::error_code& ec)
{
    ec = last_error();
    if (!ec) ec = make_error_code(errc::no_message);
}

native_handle_t create_exclusive( const fs::path& p
                                , entry_kind kind
                                , sys::error_code& ec)
{
    if (kind == entry_kind::directory) {
        if (::mkdir(p.c_str(), S_IRWXU) != 0) set_last_error(ec);
        return invalid_handle;
    }

    int file = ::open( p.c_str()
                     , O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC
                     , S_IRUSR | S_IWUSR);
    if (file == -1) set_last_error(ec);
    return file;
}

native_handle_t open( const fs::path& p
                    , access_mode mode
                    , sys::error_code& ec)
{
    int flags = (mode == access_mode::read_only ? O_RDONLY : O_RDWR) | O_CLOEXEC;
    int file = ::open(p.c_str(), flags);
    if (file == -1) set_last_error(ec);
    return file;
}

native_handle_t dup_fd(async_file_handle& f, sys::error_code& ec)
{
    int file = ::fcntl(f.native_handle(), F_DUPFD_CLOEXEC, 0);
    if (file == -1) set_last_error(ec);
    return file;
}

void fseek(async_file_handle& f, std::size_t pos, sys::error_code& ec)
{
    if (::lseek(f.native_handle(), pos, SEEK_SET) == -1) set_last_error(ec);
}

std::size_t current_position(async_file_handle& f, sys::error_code& ec)
{
    off_t offset = ::lseek(f.native_handle(), 0, SEEK_CUR);
    if (offset == -1) {
        set_last_error(ec);
        return std::size_t(-1);
    }
    return offset;
}

std::size_t file_size(async_file_handle& f, sys::error_code& ec)
{
    struct stat st;
    if (::fstat(f.native_handle(), &st) == -1) {
        set_last_error(ec);
        return std::size_t(-1);
    }
    return st.st_size;
}

void close_fd(native_handle_t fd)
{
    if (fd != invalid_handle) ::close(fd);
}

void remove_file(const fs::path& p, sys::error_code& ec)
{
    // Returns false without an error if `p` does not exist.
    fs::remove(p, ec);
}

void remove_tree(const fs::path& p, removal_failures& failures)
{
    sys::error_code ec;
    auto st = fs::symlink_status(p, ec);

    if (st.type() == fs::file_not_found) return;
    if (ec) {
        failures.push_back({p, ec});
        return;
    }

    auto failed_before = failures.size();

    if (st.type() == fs::directory_file) {
        // List first, removing entries while iterating is not portable.
        std::vector<fs::path> children;

        fs::directory_iterator it(p, ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec) failures.push_back({p, ec});

        for (const auto& child : children) {
            remove_tree(child, failures);
        }
    }

    ec.clear();
    fs::remove(p, ec);

    // A directory left non-empty by an already reported failure
    // is not reported again.
    if (ec && !( ec == errc::directory_not_empty
              && failures.size() > failed_before)) {
        failures.push_back({p, ec});
    }
}

}}} // namespaces
