#pragma once

// Copyright 2026 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>
#include <string>

namespace potfuzz
{

// The target could not be loaded or does not export the entry point.
class AdapterConstructionError : public std::runtime_error
{
  public:
    explicit AdapterConstructionError(std::string const& msg)
        : std::runtime_error(msg)
    {
    }
};

// The harness could not run an invocation at all (pipe, spawn, poll or
// waitpid failed). Unlike a target failure this ends the session.
class ExecutionTransportError : public std::runtime_error
{
  public:
    explicit ExecutionTransportError(std::string const& msg)
        : std::runtime_error(msg)
    {
    }
};
}
