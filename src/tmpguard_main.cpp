#include <cstdlib>
#include <iostream>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/write.hpp>

#include "demo_config.h"
#include "logger.h"
#include "util/file_io.h"
#include "util/fs_worker.h"
#include "util/temp_dir.h"
#include "util/temp_file.h"

using namespace std;
using namespace tmpguard;

// Give a directory some content for its removal to deal with.
static
void populate(const fs::path& dir)
{
    using util::entry_kind;
    namespace file_io = util::file_io;

    sys::error_code ec;
    file_io::close_fd(file_io::create_exclusive(dir / "content.txt", entry_kind::file, ec));
    if (!ec) file_io::create_exclusive(dir / "nested", entry_kind::directory, ec);
    if (!ec) file_io::close_fd(file_io::create_exclusive(dir / "nested" / "more.txt", entry_kind::file, ec));
    if (ec) throw sys::system_error(ec);
}

static
void run_files(const DemoConfig& config, asio::yield_context yield)
{
    vector<util::temp_file> files;

    for (unsigned i = 0; i < config.count(); ++i) {
        auto f = util::temp_file::make( util::FsWorker::global()
                                      , config.parent_dir(), config.name()
                                      , config.scheme(), yield);
        static const string greeting = "tmpguard\n";
        asio::async_write(*f, asio::buffer(greeting), yield);
        cout << f->path().string() << endl;
        files.push_back(std::move(*f));
    }

    if (config.implicit_removal()) return;

    for (auto& f : files) f.remove(yield);
}

static
void run_directories(const DemoConfig& config, asio::yield_context yield)
{
    vector<util::temp_dir> dirs;

    for (unsigned i = 0; i < config.count(); ++i) {
        auto d = util::temp_dir::make( util::FsWorker::global()
                                     , config.parent_dir(), config.name()
                                     , config.scheme(), yield);
        populate(d->path());
        cout << d->path().string() << endl;
        dirs.push_back(std::move(*d));
    }

    if (config.implicit_removal()) return;

    for (auto& d : dirs) d.remove(yield);
}

int main(int argc, const char* argv[])
{
    DemoConfig config;

    try {
        config = DemoConfig(argc, argv);
    }
    catch(const exception& e) {
        LOG_ABORT(e.what());
        return 1;
    }

    if (config.is_help()) {
        cout << "Usage: tmpguard [OPTION...]" << endl;
        cout << config.options_description() << endl;
        return EXIT_SUCCESS;
    }

    asio::io_context ctx;
    int status = EXIT_SUCCESS;

    asio::spawn(ctx, [&] (asio::yield_context yield) {
        try {
            if (config.use_directories()) run_directories(config, yield);
            else run_files(config, yield);
        }
        catch (const sys::system_error& e) {
            LOG_ERROR("Failed: ", e.code());
            status = EXIT_FAILURE;
        }
        catch (const std::exception& e) {
            LOG_ERROR("Failed: ", e.what());
            status = EXIT_FAILURE;
        }
    });

    ctx.run();

    // Make sure that removals handed over on destruction are done.
    util::FsWorker::global().stop();

    return status;
}
