#pragma once

#include <stdexcept>
#include <string>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "logger.h"
#include "namespaces.h"
#include "util/random_name.h"
#include "util/str.h"

namespace tmpguard {

class DemoConfig {
public:
    DemoConfig() = default;
    DemoConfig(const DemoConfig&) = default;
    DemoConfig(DemoConfig&&) = default;
    DemoConfig& operator=(const DemoConfig&) = default;
    DemoConfig& operator=(DemoConfig&&) = default;

    // May thow on error.
    DemoConfig(int argc, const char** argv);

    bool is_help() const
    { return _is_help; }

    boost::optional<fs::path> parent_dir() const
    { return _parent_dir; }

    boost::optional<std::string> name() const
    { return _name; }

    util::name_scheme scheme() const
    { return _use_uuid ? util::name_scheme::uuid_suffix
                       : util::name_scheme::random_suffix; }

    bool use_directories() const
    { return _use_directories; }

    unsigned count() const
    { return _count; }

    bool implicit_removal() const
    { return _implicit_removal; }

    boost::program_options::options_description
    options_description();

private:
    bool _is_help = false;
    boost::optional<fs::path> _parent_dir;
    boost::optional<std::string> _name;
    bool _use_uuid = false;
    bool _use_directories = false;
    unsigned _count = 1;
    bool _implicit_removal = false;
};

inline
boost::program_options::options_description
DemoConfig::options_description()
{
    namespace po = boost::program_options;
    using std::string;

    po::options_description desc("Options");

    desc.add_options()
        ("help", "Produce this help message")
        ("log-level", po::value<string>()->default_value(util::str(default_log_level()))
         , "Set log level: silly, debug, verbose, info, warn, error, abort")
        ("log-file", po::value<string>()
         , "Also write log messages to the given file")

        ("dir", po::value<string>()
         , "Directory to create entries in (default: the system temporary directory)")
        ("name", po::value<string>()
         , "Use this name instead of a generated one (implies \"--count 1\")")
        ("uuid", po::bool_switch(&_use_uuid)->default_value(false)
         , "Generate names with a random UUID instead of random digits")
        ("directories", po::bool_switch(&_use_directories)->default_value(false)
         , "Create directories (with some content) instead of files")
        ("count", po::value<unsigned>(&_count)->default_value(1)
         , "Number of entries to create")
        ("implicit", po::bool_switch(&_implicit_removal)->default_value(false)
         , "Leave removal to handle destruction instead of removing explicitly")
        ;

    return desc;
}

inline
DemoConfig::DemoConfig(int argc, const char** argv)
{
    namespace po = boost::program_options;
    using std::string;

    auto desc = options_description();

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if (vm.count("help")) {
        _is_help = true;
        return;
    }

    if (vm.count("log-level")) {
        auto level = boost::algorithm::to_upper_copy(vm["log-level"].as<string>());
        auto ll_o = log_level_from_string(level);
        if (!ll_o)
            throw std::runtime_error(util::str("Invalid log level: ", level));
        logger.set_threshold(*ll_o);
    }

    if (vm.count("log-file")) {
        logger.log_to_file(vm["log-file"].as<string>());
        if (!logger.get_log_file())
            throw std::runtime_error(util::str( "Cannot open log file: "
                                              , vm["log-file"].as<string>()));
    }

    if (vm.count("dir")) {
        _parent_dir = fs::path(vm["dir"].as<string>());
    }

    if (vm.count("name")) {
        _name = vm["name"].as<string>();
        if (!util::is_bare_name(*_name))
            throw std::runtime_error(util::str("Invalid entry name: ", *_name));
        _count = 1;
    }

    if (_count == 0) {
        throw std::runtime_error("The '--count' option must be positive");
    }
}

} // tmpguard namespace
