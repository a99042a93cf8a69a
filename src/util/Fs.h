#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>

namespace potfuzz
{
namespace fs
{

using native_handle_t = int;

////
// Utility functions for operating on the filesystem.
////

// Call fsync() on the descriptor, retrying on EINTR.
void flushFileChanges(native_handle_t h);

// Open a native handle (fd) for writing, truncating any existing content.
native_handle_t openFileToWrite(std::string const& path);

// Write all of `data` to h, retrying short writes and EINTR.
void writeAll(native_handle_t h, std::string const& data,
              std::string const& path);

// Close h, retrying on EINTR.
void closeFile(native_handle_t h, std::string const& path);

// Do rename(src, dst) then open dir and fsync() it too: a necessary second
// step for ensuring durability.
bool durableRename(std::string const& src, std::string const& dst,
                   std::string const& dir);

// Return whether a path exists.
bool exists(std::string const& path);

// Delete a path and everything inside it (if a dir).
void deltree(std::string const& path);

// Make a single dir; not mkdir -p, i.e. non-recursive. Returns true
// if a directory was created (but false if it already existed).
bool mkdir(std::string const& path);

// Make a dir path like mkdir -p, i.e. recursive, uses '/' as dir separator.
// Returns true iff at the end of the call, the path exists and is a directory.
bool mkpath(std::string const& path);

// Directory containing `path`, or "." for a bare file name.
std::string parentDir(std::string const& path);
}
}
