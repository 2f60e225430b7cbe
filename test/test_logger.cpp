#define BOOST_TEST_MODULE logger
#include <boost/test/included/unit_test.hpp>

#include <fstream>
#include <string>
#include <thread>

#include <boost/algorithm/string/predicate.hpp>

#include "namespaces.h"
#include "logger.h"
#include "util/test_dir.h"

BOOST_AUTO_TEST_SUITE(tmpguard_logger)

using namespace std;
using namespace tmpguard;

static
string read_contents(const fs::path& p) {
    ifstream in(p.string());
    return string(istreambuf_iterator<char>(in), istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_CASE(test_thresholds)
{
    Logger log(VERBOSE);

    BOOST_CHECK(log.would_log(VERBOSE));
    BOOST_CHECK(log.would_log(ERROR));
    BOOST_CHECK(!log.would_log(DEBUG));

    log.set_threshold(WARN);
    BOOST_CHECK_EQUAL(log.get_threshold(), WARN);
    BOOST_CHECK(!log.would_log(INFO));

    // Not a valid level, kept as is.
    log.set_threshold(static_cast<log_level_t>(42));
    BOOST_CHECK_EQUAL(log.get_threshold(), WARN);
}

BOOST_AUTO_TEST_CASE(test_level_names)
{
    BOOST_CHECK(log_level_from_string("SILLY") == SILLY);
    BOOST_CHECK(log_level_from_string("DEBUG") == DEBUG);
    BOOST_CHECK(log_level_from_string("ABORT") == ABORT);
    BOOST_CHECK(!log_level_from_string("debug"));
    BOOST_CHECK(!log_level_from_string(""));
}

BOOST_AUTO_TEST_CASE(test_log_to_file)
{
    TestDir td;
    auto path = td.path() / "tmpguard.log";

    Logger log(INFO);
    log.log_to_file(path.string());
    BOOST_REQUIRE(log.get_log_file());
    BOOST_CHECK_EQUAL(log.current_log_file(), path.string());

    log.info("This should make it out");
    log.debug("This should not make it out");
    log.get_log_file()->flush();

    auto contents = read_contents(path);
    BOOST_CHECK(boost::algorithm::contains(contents, "TMPGUARD START"));
    BOOST_CHECK(boost::algorithm::contains(contents, "[INFO] This should make it out"));
    BOOST_CHECK(!boost::algorithm::contains(contents, "not make it out"));

    // Stopping removes the file.
    log.log_to_file("");
    BOOST_CHECK(!log.get_log_file());
    BOOST_CHECK(!fs::exists(path));
}

BOOST_AUTO_TEST_CASE(test_thread_tag)
{
    TestDir td;
    auto path = td.path() / "tmpguard.log";

    Logger log(INFO);
    log.log_to_file(path.string());

    std::thread([&] {
        Logger::set_thread_tag("fs-worker");
        log.warn("From another thread");
    }).join();
    log.warn("From this thread");
    log.get_log_file()->flush();

    auto contents = read_contents(path);
    BOOST_CHECK(boost::algorithm::contains(contents, "[WARN] fs-worker: From another thread"));
    BOOST_CHECK(boost::algorithm::contains(contents, "[WARN] From this thread"));

    log.log_to_file("");
}

BOOST_AUTO_TEST_CASE(test_macros)
{
    // These go to the default logger.
    auto level = logger.get_threshold();
    logger.set_threshold(VERBOSE);
    LOG_VERBOSE("This should make it out from the default logger with the macro");
    LOG_DEBUG("This should not make it out from the default logger with the macro");
    logger.set_threshold(level);
}

BOOST_AUTO_TEST_SUITE_END()
