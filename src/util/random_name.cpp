#include <boost/filesystem.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "../error.h"
#include "random_name.h"

namespace tmpguard { namespace util {

static const fs::path random_suffix_model{"%%%%%%%%%%%%%%%%"};

bool is_bare_name(const std::string& name)
{
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of(std::string("/\0", 2)) == std::string::npos;
}

static
std::string random_suffix(name_scheme scheme, sys::error_code& ec)
{
    switch (scheme) {
        case name_scheme::random_suffix: {
            auto suffix = fs::unique_path(random_suffix_model, ec);
            if (ec) return {};
            return suffix.string();
        }
        case name_scheme::uuid_suffix: {
            try {
                boost::uuids::random_generator gen;
                return to_string(gen());
            } catch (const boost::uuids::entropy_error& e) {
                ec = sys::error_code(e.errcode(), sys::system_category());
                return {};
            }
        }
    }
    ec = error::invalid_input;
    return {};
}

std::string generate_name( entry_kind kind
                         , const boost::optional<std::string>& custom_name
                         , name_scheme scheme
                         , sys::error_code& ec)
{
    if (custom_name) {
        if (!is_bare_name(*custom_name)) {
            ec = error::invalid_input;
            return {};
        }
        return *custom_name;
    }

    auto suffix = random_suffix(scheme, ec);
    if (ec) return {};

    if (kind == entry_kind::directory)
        return dir_name_prefix + suffix;
    return file_name_prefix + suffix + file_name_extension;
}

}} // namespaces
