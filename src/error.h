#pragma once

#include <string>

#include <boost/system/error_code.hpp>

#include "namespaces.h"

namespace tmpguard { namespace error {

// Failures specific to temporary entry handling.
// Failures of the underlying system calls are reported
// with their own (generic or system) error codes.
enum errc {
    // 0 means success
    invalid_input = 1,
    not_found,
    name_collision_exhausted,
    already_consumed,
    removal_incomplete,
};

sys::error_category const& tmpguard_category();

inline
sys::error_code make_error_code(errc e) {
    return sys::error_code(static_cast<int>(e), tmpguard_category());
}

}} // tmpguard::error namespace

namespace boost { namespace system {
    template<> struct is_error_code_enum< ::tmpguard::error::errc >: std::true_type{};
}} // namespaces
