#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>
#include <string>

namespace potfuzz
{

// A snapshot file exists but cannot be parsed into a valid estimator.
class MalformedSnapshot : public std::runtime_error
{
  public:
    explicit MalformedSnapshot(std::string const& msg)
        : std::runtime_error(msg)
    {
    }
};

// An operation that needs recorded history found no snapshot.
class MissingSnapshot : public std::runtime_error
{
  public:
    explicit MissingSnapshot(std::string const& msg) : std::runtime_error(msg)
    {
    }
};
}
