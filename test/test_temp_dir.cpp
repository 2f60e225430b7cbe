#define BOOST_TEST_MODULE temp_dir
#include <boost/test/data/test_case.hpp>
#include <boost/test/included/unit_test.hpp>

#include <set>
#include <unistd.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/filesystem.hpp>

#include <defer.h>
#include <error.h>
#include <util/file_io.h>
#include <util/fs_worker.h>
#include <util/temp_dir.h>
#include <namespaces.h>

#include "util/test_dir.h"

BOOST_AUTO_TEST_SUITE(tmpguard_temp_dir)

using namespace std;
using namespace tmpguard;
using namespace tmpguard::util;

namespace errc = boost::system::errc;

template<class F>
static
void run_spawned(F&& f) {
    asio::io_context ctx;
    asio::spawn(ctx, std::forward<F>(f));
    ctx.run();
}

static
void populate_directory(const fs::path& dir) {
    sys::error_code ec;
    file_io::close_fd(file_io::create_exclusive(dir / "testfile", entry_kind::file, ec));
    BOOST_REQUIRE_EQUAL(ec.message(), "Success");
    file_io::create_exclusive(dir / "testdir", entry_kind::directory, ec);
    BOOST_REQUIRE_EQUAL(ec.message(), "Success");
    file_io::close_fd(file_io::create_exclusive(dir / "testdir" / "testfile", entry_kind::file, ec));
    BOOST_REQUIRE_EQUAL(ec.message(), "Success");
}

static
void check_directory(const fs::path& dir) {
    BOOST_REQUIRE(fs::is_directory(dir));
    BOOST_CHECK(fs::is_regular_file(dir / "testfile"));
    BOOST_REQUIRE(fs::is_directory(dir / "testdir"));
    BOOST_CHECK(fs::is_regular_file(dir / "testdir" / "testfile"));
}

BOOST_AUTO_TEST_CASE(test_default_location) {
    fs::path path;
    auto remove_leftover = tmpguard::defer([&] {
        sys::error_code ignored_ec;
        fs::remove_all(path, ignored_ec);
    });

    run_spawned([&] (asio::yield_context yield) {
        {
            auto td = temp_dir::make(yield);
            BOOST_REQUIRE(td);
            path = td->path();

            BOOST_CHECK(path.is_absolute());
            BOOST_CHECK(fs::equivalent(path.parent_path(), fs::temp_directory_path()));
            BOOST_CHECK(boost::algorithm::starts_with(path.filename().string(), dir_name_prefix));
            BOOST_CHECK(path.extension().empty());
            BOOST_CHECK(td->get_ownership() == ownership::owned);

            populate_directory(path);
            check_directory(path);
        }

        FsWorker::global().flush(yield);
        BOOST_CHECK(!fs::exists(path));
    });
}

BOOST_AUTO_TEST_CASE(test_remove_recursively) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto td = temp_dir::make(worker, scratch.path(), boost::none, name_scheme::random_suffix, yield);
        BOOST_REQUIRE(td);
        populate_directory(td->path());

        td->remove(yield);
        BOOST_CHECK(!fs::exists(td->path()));
        BOOST_CHECK(td->state() == deletion_state::deleted);
        BOOST_CHECK(td->removal_failures().empty());
        BOOST_CHECK_EQUAL(scratch.entry_count(), 0u);

        sys::error_code ec;
        td->remove(yield[ec]);
        BOOST_CHECK_EQUAL(ec, error::make_error_code(error::already_consumed));
    });
}

BOOST_AUTO_TEST_CASE(test_borrowed_directory_survives) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto owner = temp_dir::make(worker, scratch.path(), boost::none, name_scheme::random_suffix, yield);
        BOOST_REQUIRE(owner);
        populate_directory(owner->path());

        {
            sys::error_code ec;
            auto borrower = owner->borrow(ec);
            BOOST_REQUIRE_EQUAL(ec.message(), "Success");
            BOOST_CHECK_EQUAL(borrower->path(), owner->path());
            BOOST_CHECK(borrower->get_ownership() == ownership::borrowed);
        }

        worker.flush(yield);
        check_directory(owner->path());

        auto path = owner->path();
        owner.reset();
        worker.flush(yield);
        BOOST_CHECK(!fs::exists(path));
    });
}

static const ownership ownerships[] = {ownership::owned, ownership::borrowed};

BOOST_DATA_TEST_CASE(test_from_existing, boost::unit_test::data::make(ownerships), own) {
    TestDir scratch;
    FsWorker worker;
    auto path = scratch.path() / "existing";
    fs::create_directory(path);
    populate_directory(path);

    run_spawned([&] (asio::yield_context yield) {
        {
            auto td = temp_dir::from_existing(worker, path, own, yield);
            BOOST_REQUIRE(td);
            BOOST_CHECK_EQUAL(td->path(), path);
            BOOST_CHECK(td->get_ownership() == own);
        }
        worker.flush(yield);

        if (own == ownership::owned) BOOST_CHECK(!fs::exists(path));
        else check_directory(path);
    });
}

BOOST_AUTO_TEST_CASE(test_from_existing_errors) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        sys::error_code ec;
        auto td = temp_dir::from_existing(worker, scratch.path() / "missing", ownership::owned, yield[ec]);
        BOOST_CHECK(!td);
        BOOST_CHECK_EQUAL(ec, error::make_error_code(error::not_found));

        sys::error_code file_ec;
        file_io::close_fd(file_io::create_exclusive(scratch.path() / "file", entry_kind::file, file_ec));
        BOOST_REQUIRE_EQUAL(file_ec.message(), "Success");

        ec.clear();
        td = temp_dir::from_existing(worker, scratch.path() / "file", ownership::owned, yield[ec]);
        BOOST_CHECK(!td);
        BOOST_CHECK_EQUAL(ec, error::make_error_code(error::invalid_input));
        BOOST_CHECK(fs::is_regular_file(scratch.path() / "file"));
    });
}

BOOST_AUTO_TEST_CASE(test_named_never_overwrites) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto first = temp_dir::make(worker, scratch.path(), string("fixed"), name_scheme::random_suffix, yield);
        BOOST_REQUIRE(first);
        BOOST_CHECK_EQUAL(first->path(), scratch.path() / "fixed");
        populate_directory(first->path());

        sys::error_code ec;
        auto second = temp_dir::make(worker, scratch.path(), string("fixed"), name_scheme::random_suffix, yield[ec]);
        BOOST_CHECK(!second);
        BOOST_CHECK(ec == errc::file_exists);
        check_directory(first->path());
    });
}

BOOST_AUTO_TEST_CASE(test_uuid_names) {
    TestDir scratch;

    run_spawned([&] (asio::yield_context yield) {
        auto td = temp_dir::make(fs::path(scratch.path()), name_scheme::uuid_suffix, yield);
        BOOST_REQUIRE(td);
        BOOST_CHECK_EQUAL(td->path().filename().string().size(), dir_name_prefix.size() + 36);
        BOOST_CHECK(fs::is_directory(td->path()));
    });
}

BOOST_AUTO_TEST_CASE(test_implicit_removal_without_worker) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto td = temp_dir::make(worker, scratch.path(), boost::none, name_scheme::random_suffix, yield);
        BOOST_REQUIRE(td);
        populate_directory(td->path());

        worker.stop();
        td.reset();
        BOOST_CHECK_EQUAL(scratch.entry_count(), 0u);
    });
}

// Removing entries from a read-only directory fails unless privileged.
static
boost::test_tools::assertion_result unprivileged(boost::unit_test::test_unit_id)
{
    boost::test_tools::assertion_result ret(::geteuid() != 0);
    if (!ret) ret.message() << "running as root, permissions are not enforced";
    return ret;
}

BOOST_AUTO_TEST_CASE(test_removal_error) {
    using file_io::removal_failures;

    auto denied = make_error_code(errc::permission_denied);
    auto busy = make_error_code(errc::device_or_resource_busy);

    BOOST_CHECK(!removal_error(removal_failures{}));

    removal_failures one{{"/a/b", denied}};
    BOOST_CHECK_EQUAL(removal_error(one), denied);

    removal_failures several{{"/a/b", denied}, {"/a/c", busy}};
    BOOST_CHECK_EQUAL(removal_error(several), error::make_error_code(error::removal_incomplete));
}

BOOST_AUTO_TEST_CASE(test_removal_failure_is_reported
                    , * boost::unit_test::precondition(unprivileged)) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto td = temp_dir::make(worker, scratch.path(), boost::none, name_scheme::random_suffix, yield);
        BOOST_REQUIRE(td);
        populate_directory(td->path());

        auto locked = td->path() / "testdir";
        fs::permissions(locked, fs::owner_read | fs::owner_exe);
        auto unlock = tmpguard::defer([&] {
            fs::permissions(locked, fs::owner_all);
        });

        sys::error_code ec;
        td->remove(yield[ec]);
        BOOST_CHECK(ec == errc::permission_denied);
        BOOST_CHECK(td->state() == deletion_state::deletion_failed);
        BOOST_REQUIRE_EQUAL(td->removal_failures().size(), 1u);
        BOOST_CHECK_EQUAL(td->removal_failures().front().path, locked / "testfile");

        // Whatever could be removed is gone.
        BOOST_CHECK(!fs::exists(td->path() / "testfile"));
        BOOST_CHECK(fs::exists(locked / "testfile"));

        ec.clear();
        td->remove(yield[ec]);
        BOOST_CHECK_EQUAL(ec, error::make_error_code(error::already_consumed));
    });
}

BOOST_AUTO_TEST_CASE(test_several_removal_failures
                    , * boost::unit_test::precondition(unprivileged)) {
    TestDir scratch;
    FsWorker worker;

    run_spawned([&] (asio::yield_context yield) {
        auto td = temp_dir::make(worker, scratch.path(), boost::none, name_scheme::random_suffix, yield);
        BOOST_REQUIRE(td);
        populate_directory(td->path());

        // A second locked directory with a file in it.
        auto other = td->path() / "otherdir";
        sys::error_code ec;
        file_io::create_exclusive(other, entry_kind::directory, ec);
        file_io::close_fd(file_io::create_exclusive(other / "otherfile", entry_kind::file, ec));
        BOOST_REQUIRE_EQUAL(ec.message(), "Success");

        auto locked = td->path() / "testdir";
        fs::permissions(locked, fs::owner_read | fs::owner_exe);
        fs::permissions(other, fs::owner_read | fs::owner_exe);
        auto unlock = tmpguard::defer([&] {
            fs::permissions(locked, fs::owner_all);
            fs::permissions(other, fs::owner_all);
        });

        td->remove(yield[ec]);
        BOOST_CHECK_EQUAL(ec, error::make_error_code(error::removal_incomplete));
        BOOST_CHECK(td->state() == deletion_state::deletion_failed);

        std::set<fs::path> failed;
        for (const auto& f : td->removal_failures()) {
            BOOST_CHECK(f.ec == errc::permission_denied);
            failed.insert(f.path);
        }
        BOOST_CHECK_EQUAL(td->removal_failures().size(), 2u);
        BOOST_CHECK(failed.count(locked / "testfile"));
        BOOST_CHECK(failed.count(other / "otherfile"));

        BOOST_CHECK(!fs::exists(td->path() / "testfile"));
    });
}

BOOST_AUTO_TEST_CASE(test_from_existing_relative_path) {
    TestDir scratch;
    FsWorker worker;

    auto cwd = fs::current_path();
    auto restore_cwd = tmpguard::defer([&] { fs::current_path(cwd); });

    run_spawned([&] (asio::yield_context yield) {
        fs::current_path(scratch.path());
        auto td = temp_dir::from_existing(worker, ".", ownership::borrowed, yield);
        BOOST_REQUIRE(td);
        BOOST_CHECK(td->path().is_absolute());
        BOOST_CHECK_EQUAL(td->path(), fs::canonical(scratch.path()));
    });
}

BOOST_AUTO_TEST_SUITE_END()
