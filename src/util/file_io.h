#pragma once

#include <cstddef>
#include <ostream>
#include <vector>

#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>

#include "../namespaces.h"
#include "random_name.h"

namespace tmpguard { namespace util { namespace file_io {

using async_file_handle = asio::posix::stream_descriptor;
using native_handle_t = int;

static const native_handle_t invalid_handle = -1;

enum class access_mode { read_write, read_only };

inline std::ostream& operator<<(std::ostream& os, access_mode m) {
    switch (m) {
        case access_mode::read_write: return os << "read-write";
        case access_mode::read_only:  return os << "read-only";
    }
    return os << "???";
}

// Create a new file (opened for reading and writing) or directory at `p`,
// failing with `file_exists` if something is already there.
// Parent directories are not created.
// For files the open descriptor is returned, for directories `invalid_handle`.
native_handle_t create_exclusive(const fs::path& p, entry_kind, sys::error_code&);

// Open an existing file with the given access.
native_handle_t open(const fs::path& p, access_mode, sys::error_code&);

// Duplicate the descriptor, see dup(2).
// The descriptor shares offset and flags with that of the original file,
// but it stays open regardless of the original one getting closed,
// so it must be closed separately.
native_handle_t dup_fd(async_file_handle&, sys::error_code&);

// Move the offset of the descriptor to `pos` bytes from the start.
void fseek(async_file_handle&, std::size_t pos, sys::error_code&);

std::size_t current_position(async_file_handle&, sys::error_code&);

// Size of the file, leaving the offset where it was.
std::size_t file_size(async_file_handle&, sys::error_code&);

// Close a descriptor not (yet) owned by an `async_file_handle`.
void close_fd(native_handle_t);

struct removal_failure {
    fs::path path;
    sys::error_code ec;
};

using removal_failures = std::vector<removal_failure>;

// Remove a single file.  Removing a missing file is not an error.
void remove_file(const fs::path& p, sys::error_code&);

// Remove `p` and everything below it.
//
// Entries which cannot be removed are added to `failures`,
// the removal of the rest of the tree goes on regardless.
// Removing a missing path is not an error.
// Symbolic links are removed, never followed.
void remove_tree(const fs::path& p, removal_failures& failures);

}}} // namespaces
