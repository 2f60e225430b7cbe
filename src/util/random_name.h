#pragma once

#include <ostream>
#include <string>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"

namespace tmpguard { namespace util {

enum class entry_kind { file, directory };

inline std::ostream& operator<<(std::ostream& os, entry_kind k) {
    switch (k) {
        case entry_kind::file:      return os << "file";
        case entry_kind::directory: return os << "directory";
    }
    return os << "???";
}

// How the variable part of a generated name is produced.
enum class name_scheme {
    // 16 random hexadecimal digits.
    random_suffix,
    // A random (version 4) UUID.
    uuid_suffix,
};

static const std::string file_name_prefix = "tg_";
static const std::string dir_name_prefix = "tgd_";
static const std::string file_name_extension = ".tmp";

// Creating an entry with a generated name gives up
// after this many names were already taken.
static const unsigned max_name_attempts = 10;

// Whether `name` can be used as a single path component.
bool is_bare_name(const std::string& name);

// Return `custom_name` if given, otherwise a new name for an entry of the
// given kind: `<prefix><suffix>` plus the `.tmp` extension for files.
//
// Sets `ec` if `custom_name` is not a bare name
// or if no randomness could be obtained.
std::string generate_name( entry_kind
                         , const boost::optional<std::string>& custom_name
                         , name_scheme
                         , sys::error_code& ec);

}} // namespaces
